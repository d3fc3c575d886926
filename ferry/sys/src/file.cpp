#include "ferry/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>

#include "ferry/log.hpp"

namespace ferry {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    case File::OpenMode::WriteTruncate:
      return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

constexpr mode_t kCreatedFileMode = 0644;

}  // namespace

File::File(const std::filesystem::path& path, OpenMode mode)
    : _fd(::open(path.c_str(), Flags(mode), kCreatedFileMode)) {
  if (!_fd) {
    _openErrno = errno;
    log::error("Unable to open file '{}' (errno {}: {})", path.string(), _openErrno, std::strerror(_openErrno));
    return;
  }
  log::debug("File fd # {} opened for '{}'", _fd.fd(), path.string());
  if (mode == OpenMode::ReadOnly) {
    struct stat st{};
    if (::fstat(_fd.fd(), &st) == 0) {
      _fileSize = static_cast<std::size_t>(st.st_size);
    } else {
      _openErrno = errno;
      log::error("fstat failed for '{}' (errno {}: {})", path.string(), _openErrno, std::strerror(_openErrno));
      _fd.close();
    }
  }
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const ssize_t nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      log::error("pread failed on fd # {} (errno {}: {})", _fd.fd(), errno, std::strerror(errno));
      return kError;
    }
  }
}

bool File::writeAll(std::string_view data) {
  while (!data.empty()) {
    const ssize_t nbWritten = ::write(_fd.fd(), data.data(), data.size());
    if (nbWritten < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("write of {} bytes failed on fd # {} (errno {}: {})", data.size(), _fd.fd(), errno,
                 std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
  return true;
}

}  // namespace ferry
