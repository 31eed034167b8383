#include "ember/http-response.hpp"

#include <optional>
#include <string_view>

#include "ember/string-equal-ignore-case.hpp"

namespace ember {

HttpResponse &HttpResponse::header(std::string_view name, std::string_view value) {
  for (auto &[existingName, existingValue] : _headers) {
    if (CaseInsensitiveEqual(existingName, name)) {
      existingValue.assign(value);
      return *this;
    }
  }
  return addHeader(name, value);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const auto &[existingName, existingValue] : _headers) {
    if (CaseInsensitiveEqual(existingName, name)) {
      return std::string_view(existingValue);
    }
  }
  return std::nullopt;
}

}  // namespace ember
