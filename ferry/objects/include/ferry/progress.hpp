#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace ferry {

// Side-channel notification emitted while a part payload is streamed to storage.
struct ProgressSample {
  // Decoded filename of the part being written. Only valid for the duration of the callback.
  std::string_view identifier;
  uint64_t bytesTransferred{0};
  // Multipart bodies do not declare per-part lengths, so this is usually unknown.
  std::optional<uint64_t> totalBytes;
};

using ProgressCallback = std::function<void(const ProgressSample&)>;

}  // namespace ferry
