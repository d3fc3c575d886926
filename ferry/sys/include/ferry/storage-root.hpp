#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "ferry/vector.hpp"

namespace ferry {

// Canonical storage directory into which uploads are written and from which downloads are served.
// Every path handed out by this class is contained in the root: containment is checked lexically before the
// filesystem is touched, then again on the canonical path to defeat symbolic links pointing outside.
class StorageRoot {
 public:
  struct Entry {
    std::string name;
    std::uintmax_t sizeBytes{0};
  };

  struct Resolution {
    enum class Status : uint8_t { Ok, Traversal, NotFound, NotRegularFile };

    std::filesystem::path path;
    Status status{Status::NotFound};
  };

  // Throws std::invalid_argument if 'directory' is empty or not a directory, std::filesystem::filesystem_error
  // if it cannot be created.
  explicit StorageRoot(const std::filesystem::path& directory, bool createIfMissing = true);

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return _root; }

  // Destination for a file named 'leafName' directly under the root.
  // Returns std::nullopt if 'leafName' is not a single plain path component, or if the destination is a
  // symbolic link resolving outside of the root.
  [[nodiscard]] std::optional<std::filesystem::path> resolveLeaf(std::string_view leafName) const;

  // Existing regular file designated by the (already percent-decoded) relative path 'relative'.
  [[nodiscard]] Resolution resolveExisting(std::string_view relative) const;

  // Regular files directly under the root, sorted by name in descending order.
  [[nodiscard]] vector<Entry> list() const;

  // True if 'candidate' (absolute, normalized) is 'root' or below it.
  [[nodiscard]] static bool Contains(const std::filesystem::path& root, const std::filesystem::path& candidate);

 private:
  std::filesystem::path _root;
};

}  // namespace ferry
