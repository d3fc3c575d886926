#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

#include "ferry/byte-source.hpp"

namespace ferry {

// Fixed capacity byte window with two cursors: bytes in [consumed, filled) are pending.
// Refills compact pending bytes to the front instead of reallocating: the storage is allocated once and never
// grows, so the memory used by a parser built on it does not depend on the size of the stream.
class SlidingBuffer {
 public:
  // Throws std::invalid_argument if 'capacity' is 0.
  explicit SlidingBuffer(std::size_t capacity);

  // Pending bytes.
  [[nodiscard]] std::string_view data() const noexcept {
    return {_storage.get() + _consumed, _filled - _consumed};
  }

  [[nodiscard]] std::size_t size() const noexcept { return _filled - _consumed; }

  [[nodiscard]] bool empty() const noexcept { return _filled == _consumed; }

  [[nodiscard]] bool full() const noexcept { return size() == _capacity; }

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  // Highest number of pending bytes ever held.
  [[nodiscard]] std::size_t peakUsage() const noexcept { return _peakUsage; }

  // Mark the first 'nbBytes' pending bytes as consumed. 'nbBytes' must not exceed size().
  void consume(std::size_t nbBytes) noexcept;

  // Read once from 'source' into the free space, after compacting pending bytes to the front.
  // Must not be called when full().
  ReadResult refill(ByteSource& source);

 private:
  void compact() noexcept;

  std::unique_ptr<char[]> _storage;
  std::size_t _capacity;
  std::size_t _consumed{0};
  std::size_t _filled{0};
  std::size_t _peakUsage{0};
};

}  // namespace ferry
