#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ferry {

// Memoizes the content type of stored files, keyed by their resolved path.
// Each path is probed at most once per successful insertion; concurrent lookups only take a shared lock.
// When two threads probe the same path at the same time, the first insertion wins and both return it.
class ContentTypeCache {
 public:
  // Returns the content type of the file, or an empty string if it cannot be determined.
  // May throw: exceptions are treated as a probe failure.
  using Probe = std::function<std::string(const std::filesystem::path &)>;

  // Probe deducing the type from the file name extension.
  static std::string ProbeByExtension(const std::filesystem::path &path);

  explicit ContentTypeCache(std::string defaultContentType, Probe probe = ProbeByExtension);

  ContentTypeCache(const ContentTypeCache &) = delete;
  ContentTypeCache(ContentTypeCache &&) = delete;
  ContentTypeCache &operator=(const ContentTypeCache &) = delete;
  ContentTypeCache &operator=(ContentTypeCache &&) = delete;

  ~ContentTypeCache() = default;

  // Content type of 'path'. A failed or empty probe yields the default content type, which is cached as well.
  [[nodiscard]] std::string contentType(const std::filesystem::path &path);

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t nbProbes() const noexcept { return _nbProbes.load(std::memory_order_relaxed); }

  [[nodiscard]] std::string_view defaultContentType() const noexcept { return _defaultContentType; }

  void clear();

 private:
  std::string probe(const std::filesystem::path &path);

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, std::string> _entries;
  std::string _defaultContentType;
  Probe _probe;
  std::atomic<std::size_t> _nbProbes{0};
};

}  // namespace ferry
