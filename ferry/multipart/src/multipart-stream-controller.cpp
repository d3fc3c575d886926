#include "ferry/multipart-stream-controller.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/boundary.hpp"
#include "ferry/byte-source.hpp"
#include "ferry/header-block.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/log.hpp"
#include "ferry/part-sink.hpp"
#include "ferry/part-writer.hpp"
#include "ferry/transfer-error.hpp"

namespace ferry {

namespace {

constexpr std::string_view kDoubleDash = "--";

std::string_view ValidatedBoundary(std::string_view boundary) {
  if (boundary.empty() || boundary.size() > kMaxBoundaryLength) {
    throw std::invalid_argument("multipart boundary must be 1 to 70 characters long");
  }
  return boundary;
}

const UploadConfig& ValidatedConfig(const UploadConfig& config) {
  config.validate();
  return config;
}

enum class BoundaryLineKind : uint8_t { NeedMore, NotBoundary, Open, Close };

struct BoundaryLineEnd {
  BoundaryLineKind kind;
  std::size_t size{0};
};

// 'rest' follows a "--boundary" token: "--" closes the body, optional transport padding (spaces and tabs) then CRLF
// opens a part. Anything else means the token was not a boundary line.
BoundaryLineEnd ClassifyBoundaryLine(std::string_view rest) {
  if (rest.starts_with(kDoubleDash)) {
    return {BoundaryLineKind::Close, kDoubleDash.size()};
  }
  std::size_t pos = 0;
  while (pos < rest.size() && (rest[pos] == ' ' || rest[pos] == '\t')) {
    ++pos;
  }
  const auto tail = rest.substr(pos);
  if (tail.starts_with(http::CRLF)) {
    return {BoundaryLineKind::Open, pos + http::CRLF.size()};
  }
  if ((tail.size() < http::CRLF.size() && http::CRLF.starts_with(tail)) || rest == "-") {
    return {BoundaryLineKind::NeedMore};
  }
  return {BoundaryLineKind::NotBoundary};
}

std::string MakeDelimiter(std::string_view boundary) {
  std::string delimiter(http::CRLF);
  delimiter.append(MakeBoundaryToken(boundary));
  return delimiter;
}

}  // namespace

std::string_view MultipartStateName(MultipartState state) noexcept {
  switch (state) {
    case MultipartState::SeekingFirstBoundary:
      return "SeekingFirstBoundary";
    case MultipartState::ReadingHeaders:
      return "ReadingHeaders";
    case MultipartState::StreamingPayload:
      return "StreamingPayload";
    case MultipartState::Done:
      return "Done";
    case MultipartState::Aborted:
      return "Aborted";
    default:
      return "Unknown";
  }
}

MultipartStreamController::MultipartStreamController(std::string_view boundary, const StorageRoot& storage,
                                                     const FilenameDecoder& decoder, const UploadConfig& config,
                                                     ProgressCallback progress)
    : _config(ValidatedConfig(config)),
      _firstBoundary(MakeBoundaryToken(ValidatedBoundary(boundary))),
      _delimiter(MakeDelimiter(boundary)),
      _buffer(config.bufferSize),
      _storage(storage),
      _decoder(decoder),
      _progress(std::move(progress)) {}

MultipartStreamController::~MultipartStreamController() {
  if (_writer) {
    _writer->abandon(_config.deletePartialOnAbort);
  }
}

UploadResult MultipartStreamController::run(ByteSource& source) {
  if (_started) {
    throw std::logic_error("MultipartStreamController::run can only be called once");
  }
  _started = true;

  while (true) {
    switch (_result.state) {
      case MultipartState::SeekingFirstBoundary:
        seekFirstBoundary(source);
        break;
      case MultipartState::ReadingHeaders:
        readHeaders(source);
        break;
      case MultipartState::StreamingPayload:
        streamPayload(source);
        break;
      default:
        _result.peakBufferUsage = _buffer.peakUsage();
        return std::move(_result);
    }
  }
}

MultipartStreamController::Fill MultipartStreamController::fill(ByteSource& source) {
  while (true) {
    const auto res = _buffer.refill(source);
    switch (res.status) {
      case ReadResult::Status::Data:
        if (res.nbBytes == 0) {
          continue;
        }
        _result.bytesConsumed += res.nbBytes;
        return Fill::Data;
      case ReadResult::Status::End:
        return Fill::End;
      default:
        log::warn("Body source failed after {} bytes", _result.bytesConsumed);
        return Fill::End;
    }
  }
}

void MultipartStreamController::seekFirstBoundary(ByteSource& source) {
  const std::string_view token = _firstBoundary;
  while (true) {
    const auto data = _buffer.data();
    // 'matchPos' is where the candidate line starts (its CRLF when it is not the first body line)
    std::size_t matchPos = std::string_view::npos;
    std::size_t tokenPos = std::string_view::npos;
    if (_atBodyStart) {
      if (data.starts_with(token)) {
        matchPos = 0;
        tokenPos = 0;
      } else if (data.size() >= token.size() || !token.starts_with(data)) {
        _atBodyStart = false;
      }
    }
    if (!_atBodyStart) {
      matchPos = _delimiter.find(data);
      if (matchPos == BoundaryMatcher::npos) {
        // Preamble: only a possible delimiter prefix needs to be kept
        _buffer.consume(data.size() - std::min(data.size(), _delimiter.size() - 1U));
      } else {
        tokenPos = matchPos + http::CRLF.size();
      }
    }

    bool pending = false;
    if (tokenPos != std::string_view::npos) {
      const auto line = ClassifyBoundaryLine(data.substr(tokenPos + token.size()));
      if (line.kind == BoundaryLineKind::Close) {
        _buffer.consume(tokenPos + token.size() + line.size);
        log::debug("Multipart body without any part");
        _result.state = MultipartState::Done;
        return;
      }
      if (line.kind == BoundaryLineKind::Open) {
        _buffer.consume(tokenPos + token.size() + line.size);
        _result.state = MultipartState::ReadingHeaders;
        return;
      }
      _buffer.consume(matchPos);
      pending = line.kind == BoundaryLineKind::NeedMore && !_buffer.full();
      if (!pending) {
        // Boundary lookalike in the preamble ("--boundaryX..."), search after it
        _atBodyStart = false;
        _buffer.consume(1U);
        continue;
      }
    }
    if (fill(source) == Fill::End) {
      if (pending) {
        abort(TransferError::IncompleteStream, "multipart body ends after its first boundary");
      } else {
        abort(TransferError::MalformedRequest, "multipart body missing starting boundary");
      }
      return;
    }
  }
}

void MultipartStreamController::readHeaders(ByteSource& source) {
  if (_config.maxParts != 0 && _nbParts >= _config.maxParts) {
    abort(TransferError::MalformedRequest, "multipart exceeds part limit");
    return;
  }

  HeaderBlockEnd blockEnd;
  while (true) {
    blockEnd = FindHeaderBlockEnd(_buffer.data());
    if (blockEnd.found()) {
      break;
    }
    if (_buffer.size() >= _config.maxHeaderBlockBytes + http::DoubleCRLF.size() || _buffer.full()) {
      abort(TransferError::MalformedRequest, "multipart part header block too large");
      return;
    }
    if (fill(source) == Fill::End) {
      abort(TransferError::IncompleteStream, "multipart part missing header terminator");
      return;
    }
  }
  if (blockEnd.blockSize > _config.maxHeaderBlockBytes) {
    abort(TransferError::MalformedRequest, "multipart part header block too large");
    return;
  }

  _headers.clear();
  const auto invalidReason = ParseHeaderBlock(_buffer.data().substr(0, blockEnd.blockSize), _headers);
  if (!invalidReason.empty()) {
    abort(TransferError::MalformedRequest, invalidReason);
    return;
  }
  // Header views point into the buffer: decode before consuming it
  auto filename = _decoder.decode(_headers);
  _buffer.consume(blockEnd.blockSize + blockEnd.terminatorSize);
  ++_nbParts;

  if (!filename && _config.fieldPartPolicy == UploadConfig::FieldPartPolicy::Stop) {
    log::debug("Part #{} has no filename, stopping", _nbParts);
    _result.state = MultipartState::Done;
    return;
  }
  if (openPart(std::move(filename))) {
    _result.state = MultipartState::StreamingPayload;
  }
}

bool MultipartStreamController::openPart(std::optional<std::string> filename) {
  if (!filename) {
    ++_result.skippedParts;
    log::debug("Discarding part #{} without filename", _nbParts);
    _writer = std::make_unique<PartWriter>(std::make_unique<DiscardPartSink>(), std::string(),
                                           _config.progressIntervalBytes, _noProgress);
    _currentPath.reset();
    return true;
  }

  const auto leaf = SanitizeLeafName(*filename);
  if (leaf.empty()) {
    log::warn("Rejected filename '{}': no usable file name", *filename);
    abort(TransferError::PathTraversalRejected, "multipart part filename has no usable file name");
    return false;
  }
  if (leaf.size() != filename->size()) {
    log::warn("Filename '{}' reduced to '{}'", *filename, leaf);
  }
  auto destination = _storage.resolveLeaf(leaf);
  if (!destination) {
    abort(TransferError::PathTraversalRejected, "multipart part filename resolves outside of the storage root");
    return false;
  }

  auto sink = std::make_unique<FilePartSink>(*destination);
  if (!*sink) {
    log::error("Unable to create {} (errno {})", destination->string(), sink->openErrno());
    abort(TransferError::FilesystemError, "unable to create destination file");
    return false;
  }
  log::debug("Receiving '{}' into {}", *filename, destination->string());
  _writer = std::make_unique<PartWriter>(std::move(sink), std::string(leaf), _config.progressIntervalBytes,
                                         _progress);
  _currentPath = std::move(*destination);
  return true;
}

bool MultipartStreamController::finishPart() {
  auto writer = std::move(_writer);
  if (!writer->finish()) {
    if (_currentPath) {
      _result.savedParts.push_back(
          SavedPart{std::string(writer->identifier()), std::move(*_currentPath), writer->bytesWritten(), false});
    }
    _currentPath.reset();
    abort(TransferError::FilesystemError, "unable to flush destination file");
    return false;
  }
  if (_currentPath) {
    log::info("Saved {} ({} bytes)", _currentPath->string(), writer->bytesWritten());
    _result.savedParts.push_back(
        SavedPart{std::string(writer->identifier()), std::move(*_currentPath), writer->bytesWritten(), true});
    _currentPath.reset();
  }
  return true;
}

void MultipartStreamController::streamPayload(ByteSource& source) {
  // Delimiter plus the two bytes telling whether it is the terminal one
  const std::size_t needed = _delimiter.size() + 2U;
  while (true) {
    const auto data = _buffer.data();
    const auto pos = _delimiter.find(data);
    if (pos == BoundaryMatcher::npos) {
      // Everything except a possible delimiter prefix is payload
      const std::size_t payloadSize = data.size() - std::min(data.size(), _delimiter.size() - 1U);
      if (!_writer->write(data.substr(0, payloadSize))) {
        abort(TransferError::FilesystemError, "unable to write destination file");
        return;
      }
      _buffer.consume(payloadSize);
    } else {
      if (!_writer->write(data.substr(0, pos))) {
        abort(TransferError::FilesystemError, "unable to write destination file");
        return;
      }
      _buffer.consume(pos);
      if (_buffer.size() >= needed) {
        break;
      }
    }
    if (fill(source) == Fill::End) {
      abort(TransferError::IncompleteStream, "multipart part missing closing boundary");
      return;
    }
  }

  // The buffer starts with a complete delimiter followed by at least two bytes
  const auto after = _buffer.data().substr(_delimiter.size(), 2U);
  const bool terminal = after == kDoubleDash;
  if (!terminal && after != http::CRLF) {
    abort(TransferError::MalformedRequest, "multipart boundary missing CRLF");
    return;
  }
  _buffer.consume(needed);
  if (!finishPart()) {
    return;
  }
  _result.state = terminal ? MultipartState::Done : MultipartState::ReadingHeaders;
}

void MultipartStreamController::abort(TransferError error, std::string_view reason) {
  log::warn("Upload aborted in state {} after {} bytes: {}", MultipartStateName(_result.state),
            _result.bytesConsumed, reason);
  if (_writer) {
    _writer->abandon(_config.deletePartialOnAbort);
    if (_currentPath && !_config.deletePartialOnAbort) {
      _result.savedParts.push_back(
          SavedPart{std::string(_writer->identifier()), std::move(*_currentPath), _writer->bytesWritten(), false});
    }
    _writer.reset();
    _currentPath.reset();
  }
  _result.state = MultipartState::Aborted;
  _result.error = error;
  _result.reason = reason;
}

}  // namespace ferry
