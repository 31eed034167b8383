#include "ember/asset-key.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ember {

std::optional<AssetKey> AssetKey::Resolve(std::string_view decodedPath, std::string_view mountPath) {
  if (!decodedPath.starts_with(mountPath)) {
    return std::nullopt;
  }
  decodedPath.remove_prefix(mountPath.size());

  std::string key;
  key.reserve(decodedPath.size());

  while (!decodedPath.empty()) {
    const auto slashPos = decodedPath.find('/');
    const auto segment = decodedPath.substr(0, slashPos);
    if (segment == "..") {
      if (key.empty()) {
        // would escape above the mount root
        return std::nullopt;
      }
      const auto lastSlash = key.rfind('/');
      key.resize(lastSlash == std::string::npos ? 0 : lastSlash);
    } else if (!segment.empty() && segment != ".") {
      if (!key.empty()) {
        key.push_back('/');
      }
      key.append(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    decodedPath.remove_prefix(slashPos + 1);
  }

  return AssetKey(std::move(key));
}

std::string AssetKey::withSuffix(std::string_view suffix) const {
  std::string ret;
  ret.reserve(_key.size() + suffix.size());
  ret.append(_key);
  ret.append(suffix);
  return ret;
}

AssetKey AssetKey::child(std::string_view name) const {
  if (isRoot()) {
    return AssetKey(std::string(name));
  }
  std::string key;
  key.reserve(_key.size() + 1U + name.size());
  key.append(_key);
  key.push_back('/');
  key.append(name);
  return AssetKey(std::move(key));
}

}  // namespace ember
