#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "ember/handler-outcome.hpp"
#include "ember/http-request.hpp"
#include "ember/http-response.hpp"

namespace ember {

// A handler either serves the request or declines it to the next one.
using RequestHandler = std::function<HandlerOutcome(const HttpRequest&)>;

// Ordered list of handlers offered each request in turn, the way a host server would chain them.
// The first handler serving the request wins; when all decline, the fallback response is returned
// (404 Not Found by default).
class HandlerChain {
 public:
  HandlerChain();

  // Appends a handler at the end of the chain. Throws std::invalid_argument if 'handler' is empty.
  HandlerChain& add(RequestHandler handler);

  // Response returned when every handler declines.
  HandlerChain& setFallback(HttpResponse fallback);

  [[nodiscard]] HttpResponse handle(const HttpRequest& request) const;

  [[nodiscard]] std::size_t size() const noexcept { return _handlers.size(); }

 private:
  std::vector<RequestHandler> _handlers;
  HttpResponse _fallback;
};

}  // namespace ember
