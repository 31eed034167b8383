#include "ember/embedded-asset-handler.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ember/asset-key.hpp"
#include "ember/asset-store.hpp"
#include "ember/embedded-asset-config.hpp"
#include "ember/handler-outcome.hpp"
#include "ember/http-constants.hpp"
#include "ember/http-method.hpp"
#include "ember/http-request.hpp"
#include "ember/http-response.hpp"
#include "ember/http-status-code.hpp"
#include "ember/mime-mappings.hpp"
#include "ember/precompressed-variant.hpp"
#include "ember/url-decode.hpp"

namespace ember {
namespace {

constexpr std::size_t kCopyChunkSize = 8UL * 1024UL;

constexpr std::string_view kAllowedMethods = "GET, HEAD";

HttpResponse MakeMethodNotAllowed() {
  HttpResponse resp(http::StatusCodeMethodNotAllowed, http::ReasonMethodNotAllowed);
  resp.header(http::Allow, kAllowedMethods);
  return resp;
}

// Generic body on purpose: nothing about the store leaks to the client.
HttpResponse MakeServerError() {
  HttpResponse resp(http::StatusCodeInternalServerError, http::ReasonInternalServerError);
  resp.body("Error serving file.\n", http::ContentTypeTextPlain);
  return resp;
}

void SetContentLength(HttpResponse& resp, std::size_t size) {
  std::array<char, 24> buf;
  // a 64 bits value needs at most 20 chars
  const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), size);
  resp.header(http::ContentLength, std::string_view(buf.data(), res.ptr));
}

}  // namespace

EmbeddedAssetHandler::EmbeddedAssetHandler(std::shared_ptr<const AssetStore> store, EmbeddedAssetConfig config,
                                           std::shared_ptr<spdlog::logger> logger)
    : _store(std::move(store)),
      _config(std::move(config)),
      _logger(logger ? std::move(logger) : spdlog::default_logger()) {
  if (!_store) {
    throw std::invalid_argument("EmbeddedAssetHandler requires a non-null AssetStore");
  }
  _config.validate();
}

HandlerOutcome EmbeddedAssetHandler::operator()(const HttpRequest& request) const {
  const std::string_view requestPath = request.path();
  const std::string_view mountPath = _config.mountPath();

  // Not our concern: no decoding, no lookup, no logging.
  if (mountPath != "/" && !requestPath.starts_with(mountPath)) {
    return HandlerOutcome::Declined();
  }

  if (!http::IsGetOrHead(request.method())) {
    if (_config.fallthroughOnMiss) {
      return HandlerOutcome::Declined();
    }
    return HandlerOutcome::Served(MakeMethodNotAllowed());
  }

  const std::optional<std::string> decodedPath = url::DecodePath(requestPath);
  if (!decodedPath) {
    _logger->debug("Invalid percent-encoding in request path '{}'", requestPath);
    return HandlerOutcome::Declined();
  }

  const std::optional<AssetKey> key = AssetKey::Resolve(*decodedPath, mountPath);
  if (!key) {
    _logger->debug("Request path '{}' does not resolve to a key under '{}'", requestPath, mountPath);
    return HandlerOutcome::Declined();
  }

  HttpResponse resp;
  ServeResult result = ServeResult::NotFound;
  try {
    if (!key->isRoot()) {
      result = tryServe(request, *key, resp);
    }
    if (result == ServeResult::NotFound && _config.serveIndexHtml && (key->isRoot() || requestPath.ends_with('/'))) {
      result = tryServe(request, key->child(_config.defaultIndex()), resp);
    }
  } catch (const std::exception& ex) {
    _logger->error("Error serving embedded asset for '{}': {}", requestPath, ex.what());
    result = ServeResult::Failed;
  }

  switch (result) {
    case ServeResult::Served:
      return HandlerOutcome::Served(std::move(resp));
    case ServeResult::Failed:
      return HandlerOutcome::Served(MakeServerError());
    case ServeResult::NotFound:
      break;
  }
  return HandlerOutcome::Declined();
}

EmbeddedAssetHandler::ServeResult EmbeddedAssetHandler::tryServe(const HttpRequest& request, const AssetKey& key,
                                                                 HttpResponse& resp) const {
  _logger->debug("Attempting to serve embedded asset '{}'", key.str());

  if (const auto acceptEncoding = request.headerValue(http::AcceptEncoding); acceptEncoding.has_value()) {
    for (const PrecompressedVariant& variant : kPrecompressedVariantsByPreference) {
      if (!AcceptEncodingAdvertises(*acceptEncoding, variant)) {
        continue;
      }
      const std::string variantKey = key.withSuffix(GetKeySuffix(variant));
      if (_store->exists(variantKey)) {
        return serveExisting(request, variantKey, key.str(), &variant, resp);
      }
      _logger->debug("Pre-compressed variant '{}' not found", variantKey);
    }
  }

  if (!_store->exists(key.str())) {
    _logger->debug("Embedded asset '{}' not found", key.str());
    return ServeResult::NotFound;
  }
  return serveExisting(request, key.str(), key.str(), nullptr, resp);
}

EmbeddedAssetHandler::ServeResult EmbeddedAssetHandler::serveExisting(const HttpRequest& request,
                                                                      std::string_view storeKey,
                                                                      std::string_view typeKey,
                                                                      const PrecompressedVariant* variant,
                                                                      HttpResponse& resp) const {
  // Released on every return path.
  const std::unique_ptr<AssetStream> stream = _store->open(storeKey);
  if (!stream) {
    _logger->error("Embedded asset '{}' exists but could not be opened", storeKey);
    return ServeResult::Failed;
  }

  // Content-Type comes from the uncompressed key: "app.js.br" is served as text/javascript.
  std::string_view contentType = DetermineMIMETypeStr(typeKey);
  if (contentType.empty()) {
    contentType = _config.defaultContentType();
  }
  resp.header(http::ContentType, contentType);
  if (variant != nullptr) {
    resp.header(http::ContentEncoding, GetEncodingStr(*variant));
  }
  if (_config.cacheControl) {
    resp.header(http::CacheControl, *_config.cacheControl);
  }

  const std::size_t assetSize = stream->size();
  if (request.method() == http::Method::HEAD) {
    SetContentLength(resp, assetSize);
    _logger->debug("Served embedded asset headers '{}' ({} bytes)", storeKey, assetSize);
    return ServeResult::Served;
  }

  resp.reserveBody(assetSize);
  std::array<std::byte, kCopyChunkSize> buf;
  std::size_t nbCopied = 0;
  while (true) {
    const std::size_t nbRead = stream->read(buf);
    if (nbRead == AssetStream::kError) {
      _logger->error("Read error on embedded asset '{}' after {} bytes", storeKey, nbCopied);
      return ServeResult::Failed;
    }
    if (nbRead == 0) {
      break;
    }
    resp.appendBody(std::string_view(reinterpret_cast<const char*>(buf.data()), nbRead));
    nbCopied += nbRead;
  }

  if (nbCopied != assetSize) {
    _logger->error("Embedded asset '{}' announced {} bytes but {} were read", storeKey, assetSize, nbCopied);
    return ServeResult::Failed;
  }

  _logger->debug("Served embedded asset '{}' ({} bytes)", storeKey, nbCopied);
  return ServeResult::Served;
}

}  // namespace ember
