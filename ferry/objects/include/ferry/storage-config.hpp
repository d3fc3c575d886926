#pragma once

#include <filesystem>
#include <utility>

namespace ferry {

struct StorageConfig {
  void validate() const;

  StorageConfig& withDirectory(std::filesystem::path value) {
    directory = std::move(value);
    return *this;
  }

  StorageConfig& withCreateIfMissing(bool value = true) {
    createIfMissing = value;
    return *this;
  }

  // Directory receiving uploads and serving downloads. Resolved by ResolveDefaultStorageDirectory() when empty.
  std::filesystem::path directory;

  bool createIfMissing{true};
};

// First usable storage directory among, in order:
//  - the FERRY_STORAGE_DIR environment variable
//  - $HOME/.filetransfer/storage
//  - transfer_storage under the current working directory
// Candidates are created if needed; a candidate that cannot be created is skipped.
// The last one is returned as an absolute path even if it cannot be created.
std::filesystem::path ResolveDefaultStorageDirectory();

}  // namespace ferry
