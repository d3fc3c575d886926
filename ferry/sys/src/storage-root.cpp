#include "ferry/storage-root.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ferry/log.hpp"
#include "ferry/vector.hpp"

namespace ferry {

namespace {

bool IsPlainComponent(std::string_view name) {
  return !name.empty() && name != "." && name != ".." && !name.contains('/') && !name.contains('\0');
}

}  // namespace

StorageRoot::StorageRoot(const std::filesystem::path& directory, bool createIfMissing) {
  if (directory.empty()) {
    throw std::invalid_argument("StorageRoot directory cannot be empty");
  }
  if (createIfMissing) {
    std::filesystem::create_directories(directory);
  }
  if (!std::filesystem::is_directory(directory)) {
    throw std::invalid_argument("StorageRoot '" + directory.string() + "' is not a directory");
  }
  _root = std::filesystem::canonical(directory);
  log::debug("Storage root is {}", _root.string());
}

bool StorageRoot::Contains(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  const auto [rootIt, candIt] = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
  return rootIt == root.end();
}

std::optional<std::filesystem::path> StorageRoot::resolveLeaf(std::string_view leafName) const {
  if (!IsPlainComponent(leafName)) {
    log::warn("Rejected upload destination '{}'", leafName);
    return std::nullopt;
  }
  std::filesystem::path target = _root / std::filesystem::path(leafName);

  std::error_code ec;
  if (std::filesystem::is_symlink(std::filesystem::symlink_status(target, ec))) {
    const auto resolved = std::filesystem::weakly_canonical(target, ec);
    if (ec || !Contains(_root, resolved)) {
      log::warn("Rejected upload destination '{}': symbolic link leaving the storage root", leafName);
      return std::nullopt;
    }
  }
  return target;
}

StorageRoot::Resolution StorageRoot::resolveExisting(std::string_view relative) const {
  Resolution res;
  const std::filesystem::path rel(relative);
  if (relative.empty() || rel.is_absolute() || relative.contains('\0')) {
    res.status = relative.empty() ? Resolution::Status::NotFound : Resolution::Status::Traversal;
    return res;
  }

  const std::filesystem::path lexical = (_root / rel).lexically_normal();
  if (!Contains(_root, lexical)) {
    res.status = Resolution::Status::Traversal;
    return res;
  }

  std::error_code ec;
  std::filesystem::path canonical = std::filesystem::canonical(lexical, ec);
  if (ec) {
    res.status = Resolution::Status::NotFound;
    return res;
  }
  if (!Contains(_root, canonical)) {
    res.status = Resolution::Status::Traversal;
    return res;
  }
  if (!std::filesystem::is_regular_file(canonical, ec)) {
    res.status = Resolution::Status::NotRegularFile;
    return res;
  }
  res.path = std::move(canonical);
  res.status = Resolution::Status::Ok;
  return res;
}

vector<StorageRoot::Entry> StorageRoot::list() const {
  vector<Entry> entries;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(_root, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entryEc;
    if (!it->is_regular_file(entryEc)) {
      continue;
    }
    const auto size = it->file_size(entryEc);
    if (entryEc) {
      continue;
    }
    entries.push_back(Entry{it->path().filename().string(), size});
  }
  if (ec) {
    log::error("Unable to list storage root {}: {}", _root.string(), ec.message());
  }
  std::ranges::sort(entries, std::ranges::greater{}, &Entry::name);
  return entries;
}

}  // namespace ferry
