#include "ferry/sendfile.hpp"

#include <sys/sendfile.h>
#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>

#include "ferry/fd-io.hpp"
#include "ferry/file.hpp"
#include "ferry/log.hpp"

namespace ferry {

namespace {

SendfileResult CopyThroughUserSpace(int outFd, const File& file, std::size_t offset, std::size_t count,
                                    std::size_t chunkSize, std::chrono::milliseconds ioTimeout,
                                    SendfileResult res) {
  const auto buf = std::make_unique_for_overwrite<char[]>(chunkSize);
  while (res.bytesSent < count) {
    const std::size_t want = std::min(count - res.bytesSent, chunkSize);
    const std::size_t nbRead = file.readAt(std::span<char>(buf.get(), want), offset + res.bytesSent);
    if (nbRead == File::kError || nbRead == 0) {
      res.code = SendfileResult::Code::InputError;
      return res;
    }
    if (!WriteFully(outFd, std::string_view(buf.get(), nbRead), ioTimeout)) {
      res.code = SendfileResult::Code::OutputError;
      return res;
    }
    res.bytesSent += nbRead;
  }
  return res;
}

}  // namespace

SendfileResult SendFileRange(int outFd, const File& file, std::size_t offset, std::size_t count,
                             std::size_t chunkSize, std::chrono::milliseconds ioTimeout) {
  SendfileResult res;
  auto off = static_cast<off_t>(offset);
  while (res.bytesSent < count) {
    const std::size_t maxBytes = std::min(count - res.bytesSent, chunkSize);
    const ssize_t bytes = ::sendfile(outFd, file.fd(), &off, maxBytes);
    if (bytes > 0) {
      res.bytesSent += static_cast<std::size_t>(bytes);
      continue;
    }
    if (bytes == 0) {
      // end of file reached before 'count' bytes: the file was truncated after it was opened
      log::error("sendfile reached end of file fd # {} after {} of {} bytes", file.fd(), res.bytesSent, count);
      res.code = SendfileResult::Code::InputError;
      return res;
    }
    const int errnoVal = errno;
    switch (errnoVal) {
      case EINTR:
        break;
      case EAGAIN:
        if (!WaitWritable(outFd, ioTimeout)) {
          res.code = SendfileResult::Code::OutputError;
          return res;
        }
        break;
      case EINVAL:
      case ENOSYS:
        log::debug("sendfile unsupported from fd # {} to fd # {}, copying through user space", file.fd(), outFd);
        return CopyThroughUserSpace(outFd, file, offset, count, chunkSize, ioTimeout, res);
      case EIO:
        log::error("sendfile failed reading fd # {} errno={} msg={}", file.fd(), errnoVal, std::strerror(errnoVal));
        res.code = SendfileResult::Code::InputError;
        return res;
      default:
        log::error("sendfile failed fd # {} -> fd # {} errno={} msg={}", file.fd(), outFd, errnoVal,
                   std::strerror(errnoVal));
        res.code = SendfileResult::Code::OutputError;
        return res;
    }
  }
  return res;
}

}  // namespace ferry
