#include "ember/http-request.hpp"

#include <optional>
#include <string_view>

#include "ember/string-equal-ignore-case.hpp"
#include "ember/string-trim.hpp"

namespace ember {

HttpRequest &HttpRequest::addHeader(std::string_view name, std::string_view value) {
  value = TrimOws(value);
  for (auto &[existingName, existingValue] : _headers) {
    if (CaseInsensitiveEqual(existingName, name)) {
      if (!value.empty()) {
        if (!existingValue.empty()) {
          existingValue.push_back(',');
        }
        existingValue.append(value);
      }
      return *this;
    }
  }
  _headers.emplace_back(name, value);
  return *this;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const noexcept {
  for (const auto &[name, value] : _headers) {
    if (CaseInsensitiveEqual(name, headerKey)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

}  // namespace ember
