#pragma once

#include <cstddef>
#include <cstdint>

namespace ferry {

struct UploadConfig {
  // What to do with a part whose Content-Disposition carries no (or an empty) filename.
  enum class FieldPartPolicy : uint8_t {
    // Consume and discard its payload, then continue with the next part.
    Skip,
    // Consume its payload and stop parsing: the upload completes with the parts saved so far.
    Stop
  };

  enum class FilenameDecoding : uint8_t {
    // filename* first, then percent-encoded or Latin-1 mis-encoded plain filenames are recovered.
    Lenient,
    // RFC 6266: filename* first, plain filename taken literally.
    Strict
  };

  static constexpr std::size_t kMinBufferSize = 4UL * 1024UL;

  void validate() const;

  UploadConfig& withBufferSize(std::size_t value) {
    bufferSize = value;
    return *this;
  }

  UploadConfig& withMaxHeaderBlockBytes(std::size_t value) {
    maxHeaderBlockBytes = value;
    return *this;
  }

  UploadConfig& withProgressIntervalBytes(uint64_t value) {
    progressIntervalBytes = value;
    return *this;
  }

  UploadConfig& withMaxParts(std::size_t value) {
    maxParts = value;
    return *this;
  }

  UploadConfig& withDeletePartialOnAbort(bool value = true) {
    deletePartialOnAbort = value;
    return *this;
  }

  UploadConfig& withFieldPartPolicy(FieldPartPolicy value) {
    fieldPartPolicy = value;
    return *this;
  }

  UploadConfig& withFilenameDecoding(FilenameDecoding value) {
    filenameDecoding = value;
    return *this;
  }

  // Size of the fixed working buffer of the stream controller. It bounds the memory used per upload, whatever the
  // size of the uploaded files.
  std::size_t bufferSize{64UL * 1024UL};

  // Maximum size of the header block of a single part. Must fit in the working buffer.
  std::size_t maxHeaderBlockBytes{16UL * 1024UL};

  // Minimum number of payload bytes between two progress notifications of the same part.
  // A final notification is always emitted when the part ends. 0 notifies after every write.
  uint64_t progressIntervalBytes{10UL * 1024UL * 1024UL};

  // Maximum number of parts (file or field) accepted in one body. 0 means unlimited.
  std::size_t maxParts{0};

  // Remove the partially written file of the part being streamed when the upload is aborted.
  bool deletePartialOnAbort{false};

  FieldPartPolicy fieldPartPolicy{FieldPartPolicy::Skip};

  FilenameDecoding filenameDecoding{FilenameDecoding::Lenient};
};

}  // namespace ferry
