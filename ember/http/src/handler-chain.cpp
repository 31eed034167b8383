#include "ember/handler-chain.hpp"

#include <stdexcept>
#include <utility>

#include "ember/handler-outcome.hpp"
#include "ember/http-constants.hpp"
#include "ember/http-method.hpp"
#include "ember/http-request.hpp"
#include "ember/http-response.hpp"
#include "ember/http-status-code.hpp"
#include "ember/log.hpp"

namespace ember {

HandlerChain::HandlerChain() : _fallback(http::StatusCodeNotFound, http::NotFound) {
  _fallback.body("Not Found\n", http::ContentTypeTextPlain);
}

HandlerChain& HandlerChain::add(RequestHandler handler) {
  if (!handler) {
    throw std::invalid_argument("HandlerChain cannot hold an empty handler");
  }
  _handlers.push_back(std::move(handler));
  return *this;
}

HandlerChain& HandlerChain::setFallback(HttpResponse fallback) {
  _fallback = std::move(fallback);
  return *this;
}

HttpResponse HandlerChain::handle(const HttpRequest& request) const {
  for (const RequestHandler& handler : _handlers) {
    HandlerOutcome outcome = handler(request);
    if (outcome.isServed()) {
      return std::move(outcome).takeResponse();
    }
  }
  log::trace("No handler served {} {}", http::MethodToStr(request.method()), request.path());
  return _fallback;
}

}  // namespace ember
