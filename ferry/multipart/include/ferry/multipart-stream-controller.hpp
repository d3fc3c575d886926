#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ferry/boundary-matcher.hpp"
#include "ferry/byte-source.hpp"
#include "ferry/filename-decoder.hpp"
#include "ferry/header-block.hpp"
#include "ferry/part-writer.hpp"
#include "ferry/progress.hpp"
#include "ferry/sliding-buffer.hpp"
#include "ferry/storage-root.hpp"
#include "ferry/transfer-error.hpp"
#include "ferry/upload-config.hpp"
#include "ferry/vector.hpp"

namespace ferry {

enum class MultipartState : uint8_t { SeekingFirstBoundary, ReadingHeaders, StreamingPayload, Done, Aborted };

std::string_view MultipartStateName(MultipartState state) noexcept;

struct SavedPart {
  // Sanitized leaf name under the storage root.
  std::string filename;
  std::filesystem::path path;
  uint64_t sizeBytes{0};
  // False for the partially written file of a part interrupted by the end of the stream.
  bool complete{true};
};

struct UploadResult {
  [[nodiscard]] bool ok() const noexcept { return state == MultipartState::Done; }

  MultipartState state{MultipartState::SeekingFirstBoundary};
  TransferError error{TransferError::None};
  // Static description of the failure, empty on success.
  std::string_view reason;
  vector<SavedPart> savedParts;
  // Parts without filename whose payload was discarded.
  std::size_t skippedParts{0};
  // Body bytes pulled from the source.
  uint64_t bytesConsumed{0};
  // Highest number of bytes held by the working buffer, never above its capacity.
  std::size_t peakBufferUsage{0};
};

// Parses one multipart/form-data body pulled from a ByteSource and streams the file parts it contains to the storage
// root, holding at most UploadConfig::bufferSize bytes of the body in memory at any time.
//
//   SeekingFirstBoundary -> ReadingHeaders -> StreamingPayload -> (ReadingHeaders | Done)
//
// Any state moves to Aborted when the body cannot be processed further. A body delimiter may be split at any byte by
// the reads of the source: unmatched trailing bytes that could start a delimiter are kept in the buffer and searched
// again after the next read.
class MultipartStreamController {
 public:
  // 'boundary' is the value of the boundary parameter (without the leading "--").
  // 'storage' and 'decoder' are referenced and must outlive the controller.
  // Throws std::invalid_argument if 'boundary' is empty or longer than 70 bytes, or if 'config' is invalid.
  MultipartStreamController(std::string_view boundary, const StorageRoot& storage, const FilenameDecoder& decoder,
                            const UploadConfig& config, ProgressCallback progress = {});

  MultipartStreamController(const MultipartStreamController&) = delete;
  MultipartStreamController(MultipartStreamController&&) = delete;
  MultipartStreamController& operator=(const MultipartStreamController&) = delete;
  MultipartStreamController& operator=(MultipartStreamController&&) = delete;

  ~MultipartStreamController();

  // Process the whole body. Can only be called once: throws std::logic_error otherwise.
  UploadResult run(ByteSource& source);

  [[nodiscard]] MultipartState state() const noexcept { return _result.state; }

  [[nodiscard]] std::size_t bufferCapacity() const noexcept { return _buffer.capacity(); }

 private:
  enum class Fill : uint8_t { Data, End };

  Fill fill(ByteSource& source);

  void seekFirstBoundary(ByteSource& source);
  void readHeaders(ByteSource& source);
  void streamPayload(ByteSource& source);

  bool openPart(std::optional<std::string> filename);
  bool finishPart();

  void abort(TransferError error, std::string_view reason);

  UploadConfig _config;
  std::string _firstBoundary;  // "--boundary"
  BoundaryMatcher _delimiter;  // "\r\n--boundary"
  SlidingBuffer _buffer;
  const StorageRoot& _storage;
  const FilenameDecoder& _decoder;
  ProgressCallback _progress;
  ProgressCallback _noProgress;
  vector<PartHeaderView> _headers;
  std::unique_ptr<PartWriter> _writer;
  std::optional<std::filesystem::path> _currentPath;
  std::size_t _nbParts{0};
  bool _started{false};
  bool _atBodyStart{true};
  UploadResult _result;
};

}  // namespace ferry
