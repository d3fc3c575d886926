#include "ferry/content-type-cache.hpp"

#include <exception>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "ferry/log.hpp"
#include "ferry/mime-types.hpp"
#include "ferry/transfer-error.hpp"

namespace ferry {

std::string ContentTypeCache::ProbeByExtension(const std::filesystem::path &path) {
  return std::string(MimeTypeFromExtension(path.filename().native()));
}

ContentTypeCache::ContentTypeCache(std::string defaultContentType, Probe probe)
    : _defaultContentType(std::move(defaultContentType)), _probe(std::move(probe)) {
  if (_defaultContentType.empty()) {
    throw std::invalid_argument("ContentTypeCache default content type must not be empty");
  }
  if (!_probe) {
    throw std::invalid_argument("ContentTypeCache probe must be callable");
  }
}

std::string ContentTypeCache::contentType(const std::filesystem::path &path) {
  const std::string &key = path.native();
  {
    std::shared_lock lock(_mutex);
    auto it = _entries.find(key);
    if (it != _entries.end()) {
      return it->second;
    }
  }

  // Probe outside of the lock, it may touch the filesystem.
  std::string type = probe(path);

  std::unique_lock lock(_mutex);
  return _entries.try_emplace(key, std::move(type)).first->second;
}

std::string ContentTypeCache::probe(const std::filesystem::path &path) {
  _nbProbes.fetch_add(1, std::memory_order_relaxed);
  std::string type;
  try {
    type = _probe(path);
  } catch (const std::exception &ex) {
    log::warn("{} for {}: {}", TransferErrorName(TransferError::ProbeFailure), path.string(), ex.what());
    return _defaultContentType;
  }
  if (type.empty()) {
    log::debug("No content type found for {}, using {}", path.string(), _defaultContentType);
    return _defaultContentType;
  }
  return type;
}

std::size_t ContentTypeCache::size() const {
  std::shared_lock lock(_mutex);
  return _entries.size();
}

void ContentTypeCache::clear() {
  std::unique_lock lock(_mutex);
  _entries.clear();
}

}  // namespace ferry
