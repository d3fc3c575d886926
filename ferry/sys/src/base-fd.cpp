#include "ferry/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "ferry/log.hpp"

namespace ferry {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

bool BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return true;
  }
  bool ok = true;
  // On Linux the descriptor is released even when close() fails with EINTR, so it must not be retried.
  if (::close(_fd) != 0 && errno != EINTR) {
    // EIO / ENOSPC can surface here for files on network or full filesystems: data may not have been written.
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
    ok = false;
  } else {
    log::debug("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
  return ok;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace ferry
