#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ember/asset-store.hpp"

namespace ember {

// AssetStore holding its assets in memory, typically byte arrays generated into the binary.
// Populate it once at startup; once shared with handlers it must not be modified anymore.
class MemoryAssetStore : public AssetStore {
 public:
  MemoryAssetStore() noexcept = default;

  MemoryAssetStore(std::initializer_list<std::pair<std::string_view, std::string_view>> assets);

  // Add (or replace) an asset, copying its content.
  // Throws std::invalid_argument if 'key' is not a valid asset key.
  MemoryAssetStore &add(std::string_view key, std::string_view content);

  // Add (or replace) an asset referencing 'content' without copying it.
  // 'content' must outlive the store (static storage duration, as for embedded data).
  // Throws std::invalid_argument if 'key' is not a valid asset key.
  MemoryAssetStore &addStatic(std::string_view key, std::string_view content);

  [[nodiscard]] bool exists(std::string_view key) const override;

  [[nodiscard]] std::unique_ptr<AssetStream> open(std::string_view key) const override;

  [[nodiscard]] std::size_t size() const noexcept { return _assets.size(); }

  [[nodiscard]] bool empty() const noexcept { return _assets.empty(); }

 private:
  struct Entry {
    std::string owned;
    std::string_view content;
  };

  Entry &insert(std::string_view key);

  std::map<std::string, Entry, std::less<>> _assets;
};

// Stream over a contiguous block of memory that outlives it.
class MemoryAssetStream : public AssetStream {
 public:
  explicit MemoryAssetStream(std::string_view content) noexcept : _content(content) {}

  [[nodiscard]] std::size_t size() const noexcept override { return _content.size(); }

  [[nodiscard]] std::size_t read(std::span<std::byte> dst) override;

 private:
  std::string_view _content;
  std::size_t _pos{};
};

// Returns true if 'key' is a valid asset key: non-empty, relative, and made of non-empty segments
// other than "." and "..".
[[nodiscard]] bool IsValidAssetKey(std::string_view key) noexcept;

}  // namespace ember
