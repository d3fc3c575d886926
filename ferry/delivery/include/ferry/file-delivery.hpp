#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "ferry/content-type-cache.hpp"
#include "ferry/delivery-config.hpp"
#include "ferry/file.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/sendfile.hpp"
#include "ferry/storage-root.hpp"
#include "ferry/transfer-error.hpp"
#include "ferry/transfer-response.hpp"

namespace ferry {

// A download ready to be sent: response head and the opened file, or an error response.
struct PreparedDownload {
  [[nodiscard]] bool ok() const noexcept { return error == TransferError::None; }

  TransferResponse response;
  File file;
  std::filesystem::path path;
  TransferError error{TransferError::None};
};

struct DeliveryResult {
  // True if the head and the whole body (when requested) reached the output descriptor.
  [[nodiscard]] bool complete() const noexcept { return headSent && sendCode == SendfileResult::Code::Done; }

  http::StatusCode status{http::StatusCodeOK};
  TransferError error{TransferError::None};
  SendfileResult::Code sendCode{SendfileResult::Code::Done};
  bool headSent{false};
  std::size_t bodyBytesSent{0};
};

// 'attachment' Content-Disposition value suggesting 'filename' (UTF-8) to the client, with an ASCII fallback
// 'filename' parameter and an RFC 5987 'filename*' parameter.
[[nodiscard]] std::string MakeAttachmentDisposition(std::string_view filename);

// Serves files of a storage root with sendfile(2).
// The file body never transits through user space buffers, whatever its size.
class FileDelivery {
 public:
  FileDelivery(const StorageRoot &storage, ContentTypeCache &contentTypes, DeliveryConfig config);

  // Resolve the percent-decoded relative path 'relative' and build the response head.
  [[nodiscard]] PreparedDownload prepare(std::string_view relative) const;

  // Write the head of 'prepared' to 'outFd', then the file body unless 'withBody' is false.
  // Error responses are sent with their small inline body.
  [[nodiscard]] DeliveryResult send(PreparedDownload &prepared, int outFd, bool withBody = true) const;

  // prepare() then send().
  [[nodiscard]] DeliveryResult deliver(std::string_view relative, int outFd, bool withBody = true) const;

  [[nodiscard]] const DeliveryConfig &config() const noexcept { return _config; }

 private:
  const StorageRoot *_storage;
  ContentTypeCache *_contentTypes;
  DeliveryConfig _config;
};

}  // namespace ferry
