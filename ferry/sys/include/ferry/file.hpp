#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>
#include <string_view>

#include "ferry/base-fd.hpp"

namespace ferry {

class File {
 public:
  enum class OpenMode : uint8_t {
    ReadOnly,
    // Create the file if needed (mode 0644) and truncate it. Used for upload destinations.
    WriteTruncate
  };

  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. Does not throw on failure: operator bool() returns false and
  // openErrno() tells why.
  explicit File(const std::filesystem::path& path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // errno captured when opening failed, 0 otherwise.
  [[nodiscard]] int openErrno() const noexcept { return _openErrno; }

  // Size in bytes at the time of opening (0 for files opened in WriteTruncate mode).
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset, without moving the file offset.
  // Returns the number of bytes read (0 on EOF), or kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Write all of 'data' at the current offset, retrying on EINTR and short writes.
  // Returns false on error (errno is logged).
  [[nodiscard]] bool writeAll(std::string_view data);

  // Close now, reporting deferred write errors. Idempotent.
  bool close() noexcept { return _fd.close(); }

  // Raw descriptor, still owned by this File.
  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
  std::size_t _fileSize{0};
  int _openErrno{0};
};

}  // namespace ferry
