#include "ferry/part-sink.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "ferry/file.hpp"
#include "ferry/log.hpp"

namespace ferry {

FilePartSink::FilePartSink(std::filesystem::path path)
    : _path(std::move(path)), _file(_path, File::OpenMode::WriteTruncate) {}

void FilePartSink::abandon(bool removePartial) noexcept {
  _file.close();
  if (!removePartial) {
    log::warn("Keeping partial file {}", _path.string());
    return;
  }
  std::error_code ec;
  if (std::filesystem::remove(_path, ec)) {
    log::info("Removed partial file {}", _path.string());
  } else if (ec) {
    log::error("Unable to remove partial file {}: {}", _path.string(), ec.message());
  }
}

}  // namespace ferry
