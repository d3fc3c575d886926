#include "ferry/fd-byte-source.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>

#include "ferry/log.hpp"

namespace ferry {

FdByteSource::FdByteSource(int fd, std::optional<uint64_t> bodyLength, std::string_view prefetched,
                           std::chrono::milliseconds readTimeout)
    : _fd(fd), _remaining(bodyLength), _prefetched(prefetched), _readTimeout(readTimeout) {}

ReadResult FdByteSource::read(std::span<char> dst) {
  std::size_t maxBytes = dst.size();
  if (_remaining) {
    if (*_remaining == 0) {
      return {};
    }
    maxBytes = static_cast<std::size_t>(std::min<uint64_t>(maxBytes, *_remaining));
  }

  std::size_t nbBytes;
  if (!_prefetched.empty()) {
    nbBytes = std::min(maxBytes, _prefetched.size());
    std::memcpy(dst.data(), _prefetched.data(), nbBytes);
    _prefetched.remove_prefix(nbBytes);
  } else {
    while (true) {
      const ssize_t ret = ::read(_fd, dst.data(), maxBytes);
      if (ret > 0) {
        nbBytes = static_cast<std::size_t>(ret);
        break;
      }
      if (ret == 0) {
        if (_remaining) {
          log::warn("fd # {} closed with {} body bytes still expected", _fd, *_remaining);
          return {0, ReadResult::Status::Error};
        }
        return {};
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN && waitReadable()) {
        continue;
      }
      log::error("read failed on fd # {} after {} bytes (errno {}: {})", _fd, _totalRead, errno,
                 std::strerror(errno));
      return {0, ReadResult::Status::Error};
    }
  }

  _totalRead += nbBytes;
  if (_remaining) {
    *_remaining -= nbBytes;
  }
  return {nbBytes, ReadResult::Status::Data};
}

bool FdByteSource::waitReadable() const {
  pollfd pfd{_fd, POLLIN, 0};
  while (true) {
    const int rc = ::poll(&pfd, 1, static_cast<int>(_readTimeout.count()));
    if (rc > 0) {
      return true;
    }
    if (rc == 0) {
      log::warn("fd # {} idle for more than {} ms", _fd, _readTimeout.count());
      return false;
    }
    if (errno != EINTR) {
      return false;
    }
  }
}

}  // namespace ferry
