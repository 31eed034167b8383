#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ember {

// Normalized, slash separated relative path used to look up an asset in an AssetStore.
// Never starts with a slash and never contains empty, "." or ".." segments.
// The empty key is the mount-root sentinel (request path equal to the mount path).
class AssetKey {
 public:
  // Root sentinel.
  AssetKey() noexcept = default;

  // Derives the key of an already percent-decoded request path relative to 'mountPath'.
  // 'mountPath' must start and end with '/'.
  // Lexically collapses "." and ".." segments and empty segments.
  // Returns std::nullopt if 'decodedPath' is not under 'mountPath', or if normalization would
  // escape above the mount root.
  [[nodiscard]] static std::optional<AssetKey> Resolve(std::string_view decodedPath, std::string_view mountPath);

  [[nodiscard]] bool isRoot() const noexcept { return _key.empty(); }

  [[nodiscard]] std::string_view str() const noexcept { return _key; }

  // Key of a sibling variant of this asset, such as its pre-compressed version ("app.js" -> "app.js.br").
  [[nodiscard]] std::string withSuffix(std::string_view suffix) const;

  // Key of the file 'name' inside the directory designated by this key ("docs" -> "docs/index.html").
  // 'name' must be a single valid segment.
  [[nodiscard]] AssetKey child(std::string_view name) const;

  bool operator==(const AssetKey &) const noexcept = default;

 private:
  explicit AssetKey(std::string key) noexcept : _key(std::move(key)) {}

  std::string _key;
};

}  // namespace ember
