#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "ember/asset-key.hpp"
#include "ember/asset-store.hpp"
#include "ember/embedded-asset-config.hpp"
#include "ember/handler-outcome.hpp"
#include "ember/http-request.hpp"
#include "ember/precompressed-variant.hpp"

namespace spdlog {
class logger;
}

namespace ember {

// Serves assets embedded in the binary from an AssetStore, in a chain of handlers.
// For each request it either produces a complete response, or declines so that the next handler
// of the chain takes over:
//  - requests outside the mount path are declined immediately,
//  - only GET and HEAD are served (others are declined, or answered 405 without fallthroughOnMiss),
//  - pre-compressed variants (key.br, then key.gz) are preferred when the client lists their coding,
//  - directory-like requests fall back to the default index file,
//  - missing assets (including paths escaping the mount root) are always declined, never 404.
// Stateless after construction: a single instance may serve concurrent requests.
// Can be used as a RequestHandler of a HandlerChain.
class EmbeddedAssetHandler {
 public:
  // Throws std::invalid_argument if 'store' is null or 'config' is invalid.
  // A null 'logger' selects spdlog's default logger.
  explicit EmbeddedAssetHandler(std::shared_ptr<const AssetStore> store, EmbeddedAssetConfig config = {},
                                std::shared_ptr<spdlog::logger> logger = {});

  [[nodiscard]] HandlerOutcome operator()(const HttpRequest& request) const;

  [[nodiscard]] const EmbeddedAssetConfig& config() const noexcept { return _config; }

 private:
  enum class ServeResult : std::uint8_t { NotFound, Served, Failed };

  [[nodiscard]] ServeResult tryServe(const HttpRequest& request, const AssetKey& key, HttpResponse& resp) const;

  [[nodiscard]] ServeResult serveExisting(const HttpRequest& request, std::string_view storeKey,
                                          std::string_view typeKey, const PrecompressedVariant* variant,
                                          HttpResponse& resp) const;

  std::shared_ptr<const AssetStore> _store;
  EmbeddedAssetConfig _config;
  std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace ember
