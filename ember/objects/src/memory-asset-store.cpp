#include "ember/memory-asset-store.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ember/log.hpp"

namespace ember {

bool IsValidAssetKey(std::string_view key) noexcept {
  if (key.empty() || key.front() == '/') {
    return false;
  }
  while (true) {
    const auto slashPos = key.find('/');
    const auto segment = key.substr(0, slashPos);
    if (segment.empty() || segment == "." || segment == "..") {
      return false;
    }
    if (slashPos == std::string_view::npos) {
      return true;
    }
    key.remove_prefix(slashPos + 1);
  }
}

MemoryAssetStore::MemoryAssetStore(std::initializer_list<std::pair<std::string_view, std::string_view>> assets) {
  for (const auto &[key, content] : assets) {
    add(key, content);
  }
}

MemoryAssetStore::Entry &MemoryAssetStore::insert(std::string_view key) {
  if (!IsValidAssetKey(key)) {
    throw std::invalid_argument("MemoryAssetStore key must be a relative path without empty, '.' or '..' segments");
  }
  auto [it, inserted] = _assets.try_emplace(std::string(key));
  if (!inserted) {
    log::debug("Replacing embedded asset '{}'", key);
  }
  return it->second;
}

MemoryAssetStore &MemoryAssetStore::add(std::string_view key, std::string_view content) {
  Entry &entry = insert(key);
  entry.owned.assign(content);
  entry.content = entry.owned;
  return *this;
}

MemoryAssetStore &MemoryAssetStore::addStatic(std::string_view key, std::string_view content) {
  Entry &entry = insert(key);
  entry.owned.clear();
  entry.owned.shrink_to_fit();
  entry.content = content;
  return *this;
}

bool MemoryAssetStore::exists(std::string_view key) const { return _assets.contains(key); }

std::unique_ptr<AssetStream> MemoryAssetStore::open(std::string_view key) const {
  const auto it = _assets.find(key);
  if (it == _assets.end()) {
    return nullptr;
  }
  return std::make_unique<MemoryAssetStream>(it->second.content);
}

std::size_t MemoryAssetStream::read(std::span<std::byte> dst) {
  const std::size_t nbBytes = std::min(dst.size(), _content.size() - _pos);
  if (nbBytes != 0) {
    std::memcpy(dst.data(), _content.data() + _pos, nbBytes);
    _pos += nbBytes;
  }
  return nbBytes;
}

}  // namespace ember
