#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ferry/part-sink.hpp"
#include "ferry/progress.hpp"

namespace ferry {

// Streams the payload of one part to its sink as the controller delimits it, counting bytes and emitting
// throttled progress notifications. It never buffers payload itself.
class PartWriter {
 public:
  // 'progress' may be empty. It is referenced, not copied, and must outlive the writer.
  PartWriter(std::unique_ptr<PartSink> sink, std::string identifier, uint64_t progressIntervalBytes,
             const ProgressCallback& progress);

  // Write a payload slice. Returns false if the sink failed.
  [[nodiscard]] bool write(std::string_view payload);

  // The part ended normally: close the sink and emit a final progress notification with the total size.
  [[nodiscard]] bool finish();

  // The part was interrupted.
  void abandon(bool removePartial) noexcept;

  [[nodiscard]] std::string_view identifier() const noexcept { return _identifier; }

  [[nodiscard]] uint64_t bytesWritten() const noexcept { return _bytesWritten; }

  [[nodiscard]] uint32_t nbProgressNotifications() const noexcept { return _nbNotifications; }

 private:
  void notify(std::optional<uint64_t> total);

  std::unique_ptr<PartSink> _sink;
  std::string _identifier;
  const ProgressCallback& _progress;
  uint64_t _progressIntervalBytes;
  uint64_t _bytesWritten{0};
  uint64_t _lastNotifiedBytes{0};
  uint32_t _nbNotifications{0};
};

}  // namespace ferry
