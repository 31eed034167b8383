#include "ember/fake-asset-stores.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ember/asset-store.hpp"
#include "ember/memory-asset-store.hpp"

namespace ember::test {

// Decorates a stream to keep track of its lifetime in the owning store.
class TrackedStream : public AssetStream {
 public:
  TrackedStream(std::unique_ptr<AssetStream> delegate, const RecordingAssetStore &store)
      : _delegate(std::move(delegate)), _store(store) {
    std::scoped_lock lock(_store._mutex);
    ++_store._nbLiveStreams;
  }

  ~TrackedStream() override {
    std::scoped_lock lock(_store._mutex);
    --_store._nbLiveStreams;
  }

  [[nodiscard]] std::size_t size() const noexcept override { return _delegate->size(); }

  [[nodiscard]] std::size_t read(std::span<std::byte> dst) override { return _delegate->read(dst); }

 private:
  std::unique_ptr<AssetStream> _delegate;
  const RecordingAssetStore &_store;
};

namespace {

class FaultyStream : public AssetStream {
 public:
  FaultyStream(FaultyAssetStore::Fault fault, std::size_t announcedSize, std::size_t nbBytesBeforeFault,
               std::shared_ptr<std::size_t> nbLive)
      : _fault(fault),
        _announcedSize(announcedSize),
        _nbBytesBeforeFault(nbBytesBeforeFault),
        _nbLive(std::move(nbLive)) {
    ++*_nbLive;
  }

  ~FaultyStream() override { --*_nbLive; }

  [[nodiscard]] std::size_t size() const noexcept override { return _announcedSize; }

  [[nodiscard]] std::size_t read(std::span<std::byte> dst) override {
    if (_pos >= _nbBytesBeforeFault) {
      return _fault == FaultyAssetStore::Fault::ReadError ? kError : 0;
    }
    const std::size_t nbBytes = std::min(dst.size(), _nbBytesBeforeFault - _pos);
    std::memset(dst.data(), 'x', nbBytes);
    _pos += nbBytes;
    return nbBytes;
  }

 private:
  FaultyAssetStore::Fault _fault;
  std::size_t _announcedSize;
  std::size_t _nbBytesBeforeFault;
  std::size_t _pos{};
  std::shared_ptr<std::size_t> _nbLive;
};

}  // namespace

bool RecordingAssetStore::exists(std::string_view key) const {
  {
    std::scoped_lock lock(_mutex);
    _existsQueries.emplace_back(key);
  }
  return MemoryAssetStore::exists(key);
}

RecordingAssetStore &RecordingAssetStore::breakOpen(std::string_view key, OpenFault fault) {
  if (!MemoryAssetStore::exists(key)) {
    throw std::invalid_argument("cannot break an asset that was not added");
  }
  std::scoped_lock lock(_mutex);
  _brokenKeys.insert_or_assign(std::string(key), fault);
  return *this;
}

std::unique_ptr<AssetStream> RecordingAssetStore::open(std::string_view key) const {
  {
    std::scoped_lock lock(_mutex);
    _openQueries.emplace_back(key);
    if (const auto it = _brokenKeys.find(key); it != _brokenKeys.end()) {
      if (it->second == OpenFault::Throws) {
        throw std::runtime_error("cannot map asset");
      }
      return nullptr;
    }
  }
  auto stream = MemoryAssetStore::open(key);
  if (!stream) {
    return stream;
  }
  return std::make_unique<TrackedStream>(std::move(stream), *this);
}

std::vector<std::string> RecordingAssetStore::existsQueries() const {
  std::scoped_lock lock(_mutex);
  return _existsQueries;
}

std::vector<std::string> RecordingAssetStore::openQueries() const {
  std::scoped_lock lock(_mutex);
  return _openQueries;
}

std::size_t RecordingAssetStore::nbQueries() const {
  std::scoped_lock lock(_mutex);
  return _existsQueries.size() + _openQueries.size();
}

std::size_t RecordingAssetStore::nbLiveStreams() const {
  std::scoped_lock lock(_mutex);
  return _nbLiveStreams;
}

bool FaultyAssetStore::exists([[maybe_unused]] std::string_view key) const {
  if (_fault == Fault::ThrowOnExists) {
    throw std::runtime_error("asset index is corrupted");
  }
  return true;
}

std::unique_ptr<AssetStream> FaultyAssetStore::open([[maybe_unused]] std::string_view key) const {
  switch (_fault) {
    case Fault::OpenReturnsNull:
      return nullptr;
    case Fault::ThrowOnOpen:
      throw std::runtime_error("cannot map asset");
    default:
      break;
  }
  ++*_nbOpened;
  return std::make_unique<FaultyStream>(_fault, _announcedSize, _nbBytesBeforeFault, _nbLive);
}

}  // namespace ember::test
