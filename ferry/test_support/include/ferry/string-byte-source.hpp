#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "ferry/byte-source.hpp"

namespace ferry::test {

// In-memory ByteSource delivering its content in chunks of at most 'chunkSize' bytes, emulating the
// arbitrary segmentation of network reads. An optional failure can be injected after 'failAfter' bytes.
class StringByteSource : public ByteSource {
 public:
  static constexpr std::size_t kNoFailure = static_cast<std::size_t>(-1);

  explicit StringByteSource(std::string content, std::size_t chunkSize = 4096, std::size_t failAfter = kNoFailure);

  ReadResult read(std::span<char> dst) override;

  [[nodiscard]] std::size_t nbReads() const noexcept { return _nbReads; }
  [[nodiscard]] std::size_t consumed() const noexcept { return _pos; }

 private:
  std::string _content;
  std::size_t _chunkSize;
  std::size_t _failAfter;
  std::size_t _pos{0};
  std::size_t _nbReads{0};
};

// Generates a multipart/form-data body. Each part is written as
// --boundary CRLF headers CRLF CRLF payload CRLF, followed by the terminal --boundary-- CRLF.
class MultipartBodyBuilder {
 public:
  explicit MultipartBodyBuilder(std::string_view boundary) : _boundary(boundary) {}

  MultipartBodyBuilder& preamble(std::string_view text);

  MultipartBodyBuilder& filePart(std::string_view fieldName, std::string_view filenameParam, std::string_view payload,
                                 std::string_view contentType = "application/octet-stream");

  MultipartBodyBuilder& fieldPart(std::string_view fieldName, std::string_view value);

  MultipartBodyBuilder& rawPart(std::string_view headers, std::string_view payload);

  // Returns the body, closed with the terminal boundary (unless 'close' is false).
  [[nodiscard]] std::string build(bool close = true) const;

 private:
  std::string _boundary;
  std::string _body;
};

}  // namespace ferry::test
