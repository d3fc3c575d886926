#include "ferry/file-delivery.hpp"

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/content-type-cache.hpp"
#include "ferry/delivery-config.hpp"
#include "ferry/fd-io.hpp"
#include "ferry/file.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/log.hpp"
#include "ferry/percent-codec.hpp"
#include "ferry/sendfile.hpp"
#include "ferry/storage-root.hpp"
#include "ferry/transfer-error.hpp"
#include "ferry/transfer-response.hpp"

namespace ferry {

namespace {

// One '_' per non printable ASCII character or per non-ASCII code point. Quotes and backslashes are replaced
// as well so that the value never needs escaping.
std::string AsciiFallbackFilename(std::string_view filename) {
  std::string out;
  out.reserve(filename.size());
  for (char ch : filename) {
    const auto uch = static_cast<unsigned char>(ch);
    if (uch >= 0x80U) {
      if ((uch & 0xC0U) != 0x80U) {
        out.push_back('_');
      }
    } else if (uch < 0x20U || uch == 0x7FU || ch == '"' || ch == '\\') {
      out.push_back('_');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

void SetErrorResponse(PreparedDownload &prepared, TransferError error) {
  prepared.error = error;
  const http::StatusCode status = StatusCodeFor(error);
  prepared.response = TransferResponse(status);
  prepared.response.header(http::ContentType, http::ContentTypeTextPlain).body(http::ReasonPhraseFor(status));
}

}  // namespace

std::string MakeAttachmentDisposition(std::string_view filename) {
  std::string out("attachment; filename=\"");
  out.append(AsciiFallbackFilename(filename));
  out.append("\"; filename*=UTF-8''");
  out.append(PercentEncodeAttrChars(filename));
  return out;
}

FileDelivery::FileDelivery(const StorageRoot &storage, ContentTypeCache &contentTypes, DeliveryConfig config)
    : _storage(&storage), _contentTypes(&contentTypes), _config(std::move(config)) {
  _config.validate();
}

PreparedDownload FileDelivery::prepare(std::string_view relative) const {
  PreparedDownload prepared;
  StorageRoot::Resolution resolution = _storage->resolveExisting(relative);
  switch (resolution.status) {
    case StorageRoot::Resolution::Status::Ok:
      break;
    case StorageRoot::Resolution::Status::Traversal:
      log::warn("Rejected download of '{}' escaping {}", relative, _storage->path().string());
      SetErrorResponse(prepared, TransferError::PathTraversalRejected);
      return prepared;
    default:
      log::debug("Download target '{}' not found", relative);
      SetErrorResponse(prepared, TransferError::NotFound);
      return prepared;
  }

  prepared.path = std::move(resolution.path);
  prepared.file = File(prepared.path);
  if (!prepared.file) {
    // The file may have been removed between resolution and opening.
    SetErrorResponse(prepared, prepared.file.openErrno() == ENOENT ? TransferError::NotFound
                                                                    : TransferError::FilesystemError);
    return prepared;
  }

  const std::string contentType = _contentTypes->contentType(prepared.path);
  prepared.response.header(http::ContentType, contentType);
  prepared.response.header(http::ContentLength, std::to_string(prepared.file.size()));
  prepared.response.header(http::ContentDisposition,
                           MakeAttachmentDisposition(prepared.path.filename().native()));
  return prepared;
}

DeliveryResult FileDelivery::send(PreparedDownload &prepared, int outFd, bool withBody) const {
  DeliveryResult result;
  result.status = prepared.response.status();
  result.error = prepared.error;

  const std::string head = prepared.ok() || !withBody ? prepared.response.head() : prepared.response.serialize();
  if (!WriteFully(outFd, head, _config.ioTimeout)) {
    log::error("Unable to send response head for {}", prepared.path.string());
    result.sendCode = SendfileResult::Code::OutputError;
    return result;
  }
  result.headSent = true;

  if (!prepared.ok() || !withBody) {
    return result;
  }

  const SendfileResult sent =
      SendFileRange(outFd, prepared.file, 0, prepared.file.size(), _config.sendfileChunkSize, _config.ioTimeout);
  result.bodyBytesSent = sent.bytesSent;
  result.sendCode = sent.code;
  if (sent.code == SendfileResult::Code::Done) {
    log::info("Delivered {} ({} bytes)", prepared.path.string(), sent.bytesSent);
  } else {
    log::error("Delivery of {} interrupted after {} / {} bytes", prepared.path.string(), sent.bytesSent,
               prepared.file.size());
  }
  return result;
}

DeliveryResult FileDelivery::deliver(std::string_view relative, int outFd, bool withBody) const {
  PreparedDownload prepared = prepare(relative);
  return send(prepared, outFd, withBody);
}

}  // namespace ferry
