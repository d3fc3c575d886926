#include "ferry/fd-io.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <string_view>

#include "ferry/log.hpp"

namespace ferry {

bool WaitWritable(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd{fd, POLLOUT, 0};
  while (true) {
    const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc > 0) {
      if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
        log::warn("fd # {} not writable (revents=0x{:x})", fd, static_cast<unsigned>(pfd.revents));
        return false;
      }
      return true;
    }
    if (rc == 0) {
      log::warn("fd # {} did not become writable within {} ms", fd, timeout.count());
      return false;
    }
    if (errno != EINTR) {
      log::error("poll failed for fd # {} (errno {}: {})", fd, errno, std::strerror(errno));
      return false;
    }
  }
}

bool WriteFully(int fd, std::string_view data, std::chrono::milliseconds timeout) {
  while (!data.empty()) {
    const ssize_t nbWritten = ::write(fd, data.data(), data.size());
    if (nbWritten >= 0) {
      data.remove_prefix(static_cast<std::size_t>(nbWritten));
      continue;
    }
    static_assert(EAGAIN == EWOULDBLOCK, "Check logic below if EAGAIN != EWOULDBLOCK");
    switch (errno) {
      case EINTR:
        break;
      case EAGAIN:
        if (!WaitWritable(fd, timeout)) {
          return false;
        }
        break;
      default:
        log::error("write failed on fd # {} (errno {}: {})", fd, errno, std::strerror(errno));
        return false;
    }
  }
  return true;
}

}  // namespace ferry
