#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ferry {

struct ReadResult {
  enum class Status : uint8_t {
    // nbBytes > 0 bytes were read
    Data,
    // the source is exhausted, nbBytes == 0
    End,
    // the source failed (peer reset, timeout, truncated body), nbBytes == 0
    Error
  };

  std::size_t nbBytes{0};
  Status status{Status::End};
};

// Pull-based source of raw request body bytes.
class ByteSource {
 public:
  ByteSource() noexcept = default;
  ByteSource(const ByteSource&) = delete;
  ByteSource& operator=(const ByteSource&) = delete;
  ByteSource(ByteSource&&) noexcept = default;
  ByteSource& operator=(ByteSource&&) noexcept = default;

  virtual ~ByteSource() = default;

  // Read the next chunk of at most dst.size() bytes (dst is never empty).
  // Blocks until some data is available, the source ends, or fails.
  virtual ReadResult read(std::span<char> dst) = 0;
};

}  // namespace ferry
