#pragma once

#include <cstdint>
#include <utility>

#include "ember/http-response.hpp"

namespace ember {

// Result of offering a request to a handler of a chain: either a complete response,
// or a decline meaning that the next handler should take the request.
class HandlerOutcome {
 public:
  enum class Decision : std::uint8_t { Declined, Served };

  // Default to Declined.
  HandlerOutcome() noexcept = default;

  // Constructor to serve the given response.
  explicit HandlerOutcome(HttpResponse response) noexcept
      : _decision(Decision::Served), _response(std::move(response)) {}

  static HandlerOutcome Declined() noexcept { return {}; }

  static HandlerOutcome Served(HttpResponse response) noexcept { return HandlerOutcome{std::move(response)}; }

  [[nodiscard]] Decision decision() const noexcept { return _decision; }

  [[nodiscard]] bool isDeclined() const noexcept { return _decision == Decision::Declined; }

  [[nodiscard]] bool isServed() const noexcept { return _decision == Decision::Served; }

  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  Decision _decision{Decision::Declined};
  HttpResponse _response;
};

}  // namespace ember
