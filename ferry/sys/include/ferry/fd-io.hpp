#pragma once

#include <chrono>
#include <string_view>

namespace ferry {

// Wait until 'fd' becomes writable. Returns false on timeout or poll error.
[[nodiscard]] bool WaitWritable(int fd, std::chrono::milliseconds timeout);

// Write all of 'data' to 'fd' (socket, pipe or file). Retries on EINTR and waits for writability
// on EAGAIN, so it also works for non-blocking sockets. Returns false on error or timeout.
[[nodiscard]] bool WriteFully(int fd, std::string_view data, std::chrono::milliseconds timeout);

}  // namespace ferry
