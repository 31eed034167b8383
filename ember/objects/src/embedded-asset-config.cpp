#include "ember/embedded-asset-config.hpp"

#include <stdexcept>
#include <string_view>

namespace ember {

EmbeddedAssetConfig &EmbeddedAssetConfig::withMountPath(std::string_view mountPath) {
  _mountPath.assign(mountPath);
  if (!_mountPath.empty()) {
    while (!_mountPath.empty() && _mountPath.back() == '/') {
      _mountPath.pop_back();
    }
    _mountPath.push_back('/');
  }
  return *this;
}

void EmbeddedAssetConfig::validate() const {
  if (_mountPath.empty() || _mountPath.front() != '/') {
    throw std::invalid_argument("EmbeddedAssetConfig.mountPath must be non-empty and start with '/'");
  }
  if (_defaultIndex.empty()) {
    throw std::invalid_argument("EmbeddedAssetConfig.defaultIndex cannot be empty");
  }
  if (_defaultIndex.contains('/') || _defaultIndex.contains('\\') || _defaultIndex == "." || _defaultIndex == "..") {
    throw std::invalid_argument("EmbeddedAssetConfig.defaultIndex must be a single file name");
  }
  if (_defaultContentType.empty()) {
    throw std::invalid_argument("EmbeddedAssetConfig.defaultContentType cannot be empty");
  }
  if (cacheControl && (cacheControl->empty() || cacheControl->find_first_of("\r\n") != std::string::npos)) {
    throw std::invalid_argument("EmbeddedAssetConfig.cacheControl must be a non-empty single line value");
  }
}

}  // namespace ember
