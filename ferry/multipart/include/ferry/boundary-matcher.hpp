#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace ferry {

// Finds occurrences of a fixed byte pattern (a multipart delimiter) in successive buffer windows.
// Patterns of at least kSkipTableMinLength bytes are searched with a Horspool bad-character shift table
// (right to left comparison), shorter ones by direct comparison.
// Offsets returned are exact: callers derive payload ends from them.
class BoundaryMatcher {
 public:
  static constexpr std::size_t kSkipTableMinLength = 4;
  static constexpr std::size_t npos = std::string_view::npos;

  // Throws std::invalid_argument if 'pattern' is empty.
  explicit BoundaryMatcher(std::string_view pattern);

  // Index of the first occurrence of the pattern in 'haystack' starting at or after 'from', or npos.
  [[nodiscard]] std::size_t find(std::string_view haystack, std::size_t from = 0) const noexcept;

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] std::size_t size() const noexcept { return _pattern.size(); }

  [[nodiscard]] bool usesSkipTable() const noexcept { return _pattern.size() >= kSkipTableMinLength; }

 private:
  std::string _pattern;
  std::array<std::size_t, 256> _shift{};
};

}  // namespace ferry
