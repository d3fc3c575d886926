#include "ferry/boundary-matcher.hpp"

#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace ferry {

BoundaryMatcher::BoundaryMatcher(std::string_view pattern) : _pattern(pattern) {
  if (_pattern.empty()) {
    throw std::invalid_argument("BoundaryMatcher pattern cannot be empty");
  }
  if (!usesSkipTable()) {
    return;
  }
  const std::size_t len = _pattern.size();
  _shift.fill(len);
  // The last pattern byte is excluded so that a full match never yields a zero shift
  for (std::size_t pos = 0; pos + 1U < len; ++pos) {
    _shift[static_cast<unsigned char>(_pattern[pos])] = len - 1U - pos;
  }
}

std::size_t BoundaryMatcher::find(std::string_view haystack, std::size_t from) const noexcept {
  const std::size_t len = _pattern.size();
  if (from > haystack.size() || haystack.size() - from < len) {
    return npos;
  }
  if (!usesSkipTable()) {
    for (std::size_t pos = from; pos + len <= haystack.size(); ++pos) {
      if (haystack.substr(pos, len) == _pattern) {
        return pos;
      }
    }
    return npos;
  }

  const std::size_t last = len - 1U;
  for (std::size_t pos = from; pos + len <= haystack.size();) {
    std::size_t idx = last;
    while (haystack[pos + idx] == _pattern[idx]) {
      if (idx == 0) {
        return pos;
      }
      --idx;
    }
    pos += _shift[static_cast<unsigned char>(haystack[pos + last])];
  }
  return npos;
}

}  // namespace ferry
