#include "ferry/part-writer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/log.hpp"
#include "ferry/part-sink.hpp"
#include "ferry/progress.hpp"

namespace ferry {

PartWriter::PartWriter(std::unique_ptr<PartSink> sink, std::string identifier, uint64_t progressIntervalBytes,
                       const ProgressCallback& progress)
    : _sink(std::move(sink)),
      _identifier(std::move(identifier)),
      _progress(progress),
      _progressIntervalBytes(progressIntervalBytes) {}

bool PartWriter::write(std::string_view payload) {
  if (payload.empty()) {
    return true;
  }
  if (!_sink->write(payload)) {
    log::error("Write of {} bytes to '{}' failed after {} bytes", payload.size(), _identifier, _bytesWritten);
    return false;
  }
  _bytesWritten += payload.size();
  if (_bytesWritten - _lastNotifiedBytes >= _progressIntervalBytes) {
    notify(std::nullopt);
  }
  return true;
}

bool PartWriter::finish() {
  if (!_sink->finish()) {
    log::error("Unable to close '{}' after {} bytes", _identifier, _bytesWritten);
    return false;
  }
  notify(_bytesWritten);
  return true;
}

void PartWriter::abandon(bool removePartial) noexcept {
  log::warn("Part '{}' interrupted after {} bytes", _identifier, _bytesWritten);
  _sink->abandon(removePartial);
}

void PartWriter::notify(std::optional<uint64_t> total) {
  _lastNotifiedBytes = _bytesWritten;
  ++_nbNotifications;
  if (_progress) {
    _progress(ProgressSample{_identifier, _bytesWritten, total});
  }
}

}  // namespace ferry
