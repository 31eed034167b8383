#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ember/http-constants.hpp"

namespace ember {

/// Configuration knobs for EmbeddedAssetHandler (serving assets baked into the binary).
/// Immutable once handed to a handler, which keeps its own copy.
class EmbeddedAssetConfig {
 public:
  static constexpr std::string_view kDefaultCacheControl = "max-age=604800";  // 1 week

  void validate() const;

  /// URL path prefix this handler is scoped to. Always ends with exactly one '/'.
  [[nodiscard]] std::string_view mountPath() const noexcept { return _mountPath; }

  /// Name of the file served for directory-like requests ("/docs/" -> "docs/index.html").
  [[nodiscard]] std::string_view defaultIndex() const noexcept { return _defaultIndex; }

  /// Content-Type used when the asset extension is unknown.
  [[nodiscard]] std::string_view defaultContentType() const noexcept { return _defaultContentType; }

  /// Sets the mount path. A missing trailing slash is added, and extra trailing slashes are collapsed:
  /// "/assets" and "/assets//" both become "/assets/".
  EmbeddedAssetConfig &withMountPath(std::string_view mountPath);

  EmbeddedAssetConfig &withDefaultIndex(std::string_view indexFile) {
    _defaultIndex.assign(indexFile);
    return *this;
  }

  EmbeddedAssetConfig &withDefaultContentType(std::string_view contentType) {
    _defaultContentType.assign(contentType);
    return *this;
  }

  EmbeddedAssetConfig &withCacheControl(std::string_view value) {
    cacheControl.emplace(value);
    return *this;
  }

  EmbeddedAssetConfig &withoutCacheControl() {
    cacheControl.reset();
    return *this;
  }

  // If true, requests with a method other than GET or HEAD are declined to the next handler.
  // Otherwise they are answered with 405 Method Not Allowed.
  // Requests for missing assets are declined regardless of this flag.
  bool fallthroughOnMiss{true};

  // Whether directory-like requests (trailing slash or mount root) fall back to defaultIndex.
  bool serveIndexHtml{true};

  // Value of the Cache-Control header of served assets. The header is omitted when empty optional.
  std::optional<std::string> cacheControl{kDefaultCacheControl};

 private:
  std::string _mountPath{"/"};
  std::string _defaultIndex{"index.html"};
  std::string _defaultContentType{http::ContentTypeApplicationOctetStream};
};

}  // namespace ember
