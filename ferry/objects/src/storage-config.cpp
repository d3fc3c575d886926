#include "ferry/storage-config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "ferry/log.hpp"

namespace ferry {

namespace {

bool TryCreate(const std::filesystem::path& candidate) {
  std::error_code ec;
  std::filesystem::create_directories(candidate, ec);
  if (ec) {
    log::warn("Unable to use storage directory {}: {}", candidate.string(), ec.message());
    return false;
  }
  return std::filesystem::is_directory(candidate, ec);
}

}  // namespace

void StorageConfig::validate() const {
  if (!directory.empty() && std::filesystem::exists(directory) && !std::filesystem::is_directory(directory)) {
    throw std::invalid_argument("StorageConfig.directory exists but is not a directory");
  }
}

std::filesystem::path ResolveDefaultStorageDirectory() {
  if (const char* envDir = std::getenv("FERRY_STORAGE_DIR"); envDir != nullptr && *envDir != '\0') {
    std::filesystem::path candidate(envDir);
    if (TryCreate(candidate)) {
      return candidate;
    }
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    std::filesystem::path candidate = std::filesystem::path(home) / ".filetransfer" / "storage";
    if (TryCreate(candidate)) {
      return candidate;
    }
  }
  return std::filesystem::absolute("transfer_storage");
}

}  // namespace ferry
