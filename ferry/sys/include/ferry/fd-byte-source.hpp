#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "ferry/byte-source.hpp"

namespace ferry {

// ByteSource reading a request body from a descriptor it does not own.
class FdByteSource : public ByteSource {
 public:
  // 'bodyLength' is the declared Content-Length when known: the source ends after that many bytes, and a
  // descriptor ending earlier is reported as an error.
  // 'prefetched' holds body bytes already consumed from 'fd' along with the request head; they are
  // delivered first and count towards 'bodyLength'. The viewed storage must outlive this object.
  explicit FdByteSource(int fd, std::optional<uint64_t> bodyLength = std::nullopt, std::string_view prefetched = {},
                        std::chrono::milliseconds readTimeout = std::chrono::seconds{30});

  ReadResult read(std::span<char> dst) override;

  [[nodiscard]] uint64_t totalRead() const noexcept { return _totalRead; }

 private:
  [[nodiscard]] bool waitReadable() const;

  int _fd;
  std::optional<uint64_t> _remaining;
  std::string_view _prefetched;
  std::chrono::milliseconds _readTimeout;
  uint64_t _totalRead{0};
};

}  // namespace ferry
