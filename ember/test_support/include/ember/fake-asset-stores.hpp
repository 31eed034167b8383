#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ember/asset-store.hpp"
#include "ember/memory-asset-store.hpp"

namespace ember::test {

// MemoryAssetStore recording every key it is queried with (exists and open), to check which
// lookups a handler performs.
class RecordingAssetStore : public MemoryAssetStore {
 public:
  // How open() misbehaves on a broken key. exists() keeps reporting it.
  enum class OpenFault : std::uint8_t {
    ReturnsNull,  // open() returns no stream
    Throws,       // open() throws std::runtime_error
  };

  using MemoryAssetStore::MemoryAssetStore;

  // Makes open() fail for 'key', which must have been added. Other keys are unaffected.
  RecordingAssetStore &breakOpen(std::string_view key, OpenFault fault);

  [[nodiscard]] bool exists(std::string_view key) const override;

  [[nodiscard]] std::unique_ptr<AssetStream> open(std::string_view key) const override;

  [[nodiscard]] std::vector<std::string> existsQueries() const;

  [[nodiscard]] std::vector<std::string> openQueries() const;

  [[nodiscard]] std::size_t nbQueries() const;

  // Number of streams opened and not yet destroyed.
  [[nodiscard]] std::size_t nbLiveStreams() const;

 private:
  friend class TrackedStream;

  mutable std::mutex _mutex;
  mutable std::vector<std::string> _existsQueries;
  mutable std::vector<std::string> _openQueries;
  std::map<std::string, OpenFault, std::less<>> _brokenKeys;
  mutable std::size_t _nbLiveStreams{};
};

// Store whose keys all exist, but misbehaves when they are opened or read.
class FaultyAssetStore : public AssetStore {
 public:
  enum class Fault : std::uint8_t {
    OpenReturnsNull,   // exists() and open() disagree
    ReadError,         // read() fails after 'nbBytesBeforeFault' bytes
    TruncatedStream,   // stream ends after 'nbBytesBeforeFault' bytes but announces more
    ThrowOnOpen,       // open() throws std::runtime_error
    ThrowOnExists,     // exists() throws std::runtime_error
  };

  explicit FaultyAssetStore(Fault fault, std::size_t announcedSize = 16, std::size_t nbBytesBeforeFault = 4)
      : _fault(fault), _announcedSize(announcedSize), _nbBytesBeforeFault(nbBytesBeforeFault) {}

  [[nodiscard]] bool exists(std::string_view key) const override;

  [[nodiscard]] std::unique_ptr<AssetStream> open(std::string_view key) const override;

  [[nodiscard]] std::size_t nbOpenedStreams() const noexcept { return *_nbOpened; }

  [[nodiscard]] std::size_t nbLiveStreams() const noexcept { return *_nbLive; }

 private:
  Fault _fault;
  std::size_t _announcedSize;
  std::size_t _nbBytesBeforeFault;
  std::shared_ptr<std::size_t> _nbOpened = std::make_shared<std::size_t>(0);
  std::shared_ptr<std::size_t> _nbLive = std::make_shared<std::size_t>(0);
};

}  // namespace ember::test
