#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "ferry/file.hpp"

namespace ferry {

struct SendfileResult {
  enum class Code : uint8_t {
    Done,
    // The output descriptor failed (peer closed the connection, timeout, I/O error).
    OutputError,
    // The file could not be read or ended before 'count' bytes were sent.
    InputError
  };

  std::size_t bytesSent{0};
  Code code{Code::Done};
};

// Transfer 'count' bytes of 'file' starting at 'offset' to 'outFd' with the kernel sendfile(2) primitive,
// in chunks of at most 'chunkSize' bytes, without copying them through user space.
// Waits for writability when 'outFd' is a non-blocking socket.
// Falls back to a pread / write loop if the kernel refuses sendfile for this pair of descriptors.
[[nodiscard]] SendfileResult SendFileRange(int outFd, const File& file, std::size_t offset, std::size_t count,
                                           std::size_t chunkSize, std::chrono::milliseconds ioTimeout);

}  // namespace ferry
