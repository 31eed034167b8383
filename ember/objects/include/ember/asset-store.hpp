#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <span>
#include <string_view>

namespace ember {

// Sequential reader over the bytes of one asset.
// Always owned through std::unique_ptr: the stream is released when its owner goes out of scope,
// whatever the exit path.
class AssetStream {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  AssetStream() noexcept = default;

  AssetStream(const AssetStream &) = delete;
  AssetStream &operator=(const AssetStream &) = delete;

  virtual ~AssetStream() = default;

  // Total size in bytes of the asset.
  [[nodiscard]] virtual std::size_t size() const noexcept = 0;

  // Read up to dst.size() bytes from the current position.
  // Returns the number of bytes read (0 at end of stream), or kError on error.
  [[nodiscard]] virtual std::size_t read(std::span<std::byte> dst) = 0;
};

// Read-only key -> blob store of assets baked into the binary.
// Keys are POSIX style relative paths without leading slash ("css/style.css").
// Implementations must support concurrent calls from several threads.
class AssetStore {
 public:
  AssetStore() noexcept = default;

  AssetStore(const AssetStore &) = delete;
  AssetStore &operator=(const AssetStore &) = delete;

  virtual ~AssetStore() = default;

  [[nodiscard]] virtual bool exists(std::string_view key) const = 0;

  // Returns a stream over the asset content, or nullptr if 'key' does not exist.
  [[nodiscard]] virtual std::unique_ptr<AssetStream> open(std::string_view key) const = 0;
};

}  // namespace ember
