#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ember/http-constants.hpp"
#include "ember/http-status-code.hpp"

namespace ember {

// Response produced by a handler: status line, headers kept in insertion order, and a fully
// buffered body. Serialization to the wire (and reserved headers such as Date or Connection)
// belongs to the host server.
class HttpResponse {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  HttpResponse() = default;

  explicit HttpResponse(http::StatusCode code, std::string_view reason = {}) : _reason(reason), _statusCode(code) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  HttpResponse &status(http::StatusCode code, std::string_view reason = {}) {
    _statusCode = code;
    _reason.assign(reason);
    return *this;
  }

  // Sets the header 'name' to 'value', replacing the value of an existing header with the same
  // (case-insensitive) name, or appending it otherwise.
  HttpResponse &header(std::string_view name, std::string_view value);

  // Appends a header without checking for duplicates.
  HttpResponse &addHeader(std::string_view name, std::string_view value) {
    _headers.emplace_back(name, value);
    return *this;
  }

  // Returns the value of the first header matching 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] const std::vector<HeaderField> &headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse &body(std::string body) {
    _body = std::move(body);
    return *this;
  }

  // Sets the body along with its Content-Type header.
  HttpResponse &body(std::string body, std::string_view contentType) {
    header(http::ContentType, contentType);
    return this->body(std::move(body));
  }

  HttpResponse &appendBody(std::string_view data) {
    _body.append(data);
    return *this;
  }

  void reserveBody(std::size_t capacity) { _body.reserve(capacity); }

 private:
  std::string _reason{http::ReasonOK};
  std::vector<HeaderField> _headers;
  std::string _body;
  http::StatusCode _statusCode{http::StatusCodeOK};
};

}  // namespace ember
