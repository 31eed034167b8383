#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ember/http-method.hpp"

namespace ember {

// Request descriptor handed to handlers by the host server: method, raw path and headers.
// The path is kept exactly as received on the request line (still percent-encoded, without query).
class HttpRequest {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  HttpRequest() = default;

  HttpRequest(http::Method method, std::string path) : _path(std::move(path)), _method(method) {}

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Appends a header field. Leading and trailing whitespace of the value is trimmed.
  // A second field with the same (case-insensitive) name is comma-joined to the first one.
  HttpRequest &addHeader(std::string_view name, std::string_view value);

  // Returns the header value for the given key, case-insensitively, or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept;

  // Like headerValue() but returns an empty string_view when absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept {
    return headerValue(headerKey).value_or(std::string_view{});
  }

  [[nodiscard]] const std::vector<HeaderField> &headers() const noexcept { return _headers; }

 private:
  std::string _path{"/"};
  std::vector<HeaderField> _headers;
  http::Method _method{http::Method::GET};
};

}  // namespace ember
