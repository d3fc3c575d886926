#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "ferry/vector.hpp"

namespace ferry {

struct PartHeaderView {
  std::string_view name;
  std::string_view value;
};

struct HeaderBlockEnd {
  // Size of the header block, without its terminator.
  std::size_t blockSize{0};
  // Size of the terminator: 4 for CRLF CRLF, 2 when the block is empty (the part starts with a bare CRLF).
  std::size_t terminatorSize{0};

  [[nodiscard]] bool found() const noexcept { return terminatorSize != 0; }
};

// Locate the end of the header block at the start of 'buffer'.
[[nodiscard]] HeaderBlockEnd FindHeaderBlockEnd(std::string_view buffer) noexcept;

// Split a header block (CRLF separated lines, without terminator) into name / value views appended to 'headers'.
// Lines without a colon or without a name (obs-fold continuations, garbage) are skipped, unless they start with
// "Content-Disposition". Returns an empty string on success, a static reason otherwise.
[[nodiscard]] std::string_view ParseHeaderBlock(std::string_view block, vector<PartHeaderView>& headers);

// Value of the first header named 'name' (case-insensitive), or an empty string_view.
[[nodiscard]] std::string_view HeaderValueOrEmpty(std::span<const PartHeaderView> headers,
                                                  std::string_view name) noexcept;

}  // namespace ferry
