#include "ferry/sliding-buffer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <stdexcept>

#include "ferry/byte-source.hpp"

namespace ferry {

SlidingBuffer::SlidingBuffer(std::size_t capacity)
    : _storage(std::make_unique_for_overwrite<char[]>(capacity)), _capacity(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("SlidingBuffer capacity must be > 0");
  }
}

void SlidingBuffer::consume(std::size_t nbBytes) noexcept {
  _consumed += std::min(nbBytes, size());
  if (_consumed == _filled) {
    _consumed = 0;
    _filled = 0;
  }
}

void SlidingBuffer::compact() noexcept {
  if (_consumed == 0) {
    return;
  }
  const std::size_t pending = size();
  std::memmove(_storage.get(), _storage.get() + _consumed, pending);
  _consumed = 0;
  _filled = pending;
}

ReadResult SlidingBuffer::refill(ByteSource& source) {
  compact();
  const ReadResult res = source.read(std::span<char>(_storage.get() + _filled, _capacity - _filled));
  if (res.status == ReadResult::Status::Data) {
    _filled += res.nbBytes;
    _peakUsage = std::max(_peakUsage, size());
  }
  return res;
}

}  // namespace ferry
