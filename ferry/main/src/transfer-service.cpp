#include "ferry/transfer-service.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/ascii.hpp"
#include "ferry/boundary.hpp"
#include "ferry/byte-source.hpp"
#include "ferry/fd-io.hpp"
#include "ferry/file-delivery.hpp"
#include "ferry/filename-decoder.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/log.hpp"
#include "ferry/multipart-stream-controller.hpp"
#include "ferry/percent-codec.hpp"
#include "ferry/progress.hpp"
#include "ferry/storage-config.hpp"
#include "ferry/transfer-error.hpp"
#include "ferry/transfer-response.hpp"
#include "ferry/transfer-service-config.hpp"
#include "ferry/upload-config.hpp"

namespace ferry {

namespace {

TransferServiceConfig Validated(TransferServiceConfig config) {
  config.validate();
  if (config.storage.directory.empty()) {
    config.storage.directory = ResolveDefaultStorageDirectory();
  }
  return config;
}

std::unique_ptr<FilenameDecoder> MakeFilenameDecoder(UploadConfig::FilenameDecoding decoding) {
  switch (decoding) {
    case UploadConfig::FilenameDecoding::Strict:
      return std::make_unique<StrictFilenameDecoder>();
    default:
      return std::make_unique<LenientFilenameDecoder>();
  }
}

TransferResponse MakeErrorResponse(http::StatusCode status, std::string_view reason) {
  TransferResponse response(status);
  response.header(http::ContentType, http::ContentTypeTextPlain);
  response.body(reason.empty() ? http::ReasonPhraseFor(status) : reason);
  return response;
}

bool IsMultipartFormData(std::string_view contentType) {
  const std::string_view mediaType = TrimOws(contentType.substr(0, contentType.find(';')));
  return CaseInsensitiveEqual(mediaType, http::ContentTypeMultipartFormData);
}

}  // namespace

TransferService::TransferService(TransferServiceConfig config)
    : _config(Validated(std::move(config))),
      _storage(_config.storage.directory, _config.storage.createIfMissing),
      _decoder(MakeFilenameDecoder(_config.upload.filenameDecoding)),
      _contentTypes(_config.delivery.defaultContentType),
      _delivery(_storage, _contentTypes, _config.delivery),
      _pool(_config.nbWorkerThreads, _config.maxQueuedJobs) {
  log::info("Transfer service storing files in {}", _storage.path().string());
}

TransferService::~TransferService() { _pool.shutdown(); }

UploadOutcome TransferService::handleUpload(std::string_view method, std::string_view contentType, ByteSource &body,
                                            ProgressCallback progress) const {
  UploadOutcome outcome;
  if (method != http::POST) {
    outcome.result.state = MultipartState::Aborted;
    outcome.response = MakeErrorResponse(http::StatusCodeMethodNotAllowed, {});
    outcome.response.header("Allow", http::POST);
    return outcome;
  }
  if (!IsMultipartFormData(contentType)) {
    log::warn("Rejected upload with content type '{}'", contentType);
    outcome.result.state = MultipartState::Aborted;
    outcome.result.error = TransferError::MalformedRequest;
    outcome.result.reason = "content type is not multipart/form-data";
    outcome.response = MakeErrorResponse(http::StatusCodeUnsupportedMediaType, outcome.result.reason);
    return outcome;
  }
  const std::string_view boundary = ExtractBoundary(contentType);
  if (boundary.empty()) {
    log::warn("Rejected upload without usable boundary in '{}'", contentType);
    outcome.result.state = MultipartState::Aborted;
    outcome.result.error = TransferError::MalformedRequest;
    outcome.result.reason = "missing or invalid multipart boundary";
    outcome.response = MakeErrorResponse(http::StatusCodeBadRequest, outcome.result.reason);
    return outcome;
  }

  MultipartStreamController controller(boundary, _storage, *_decoder, _config.upload, std::move(progress));
  outcome.result = controller.run(body);
  if (outcome.result.ok()) {
    log::info("Upload done: {} file(s) saved, {} part(s) skipped, {} bytes read", outcome.result.savedParts.size(),
              outcome.result.skippedParts, outcome.result.bytesConsumed);
    outcome.response = TransferResponse(http::StatusCodeFound);
    outcome.response.header(http::Location, "/");
  } else {
    log::warn("Upload failed with {}: {}", TransferErrorName(outcome.result.error), outcome.result.reason);
    outcome.response = MakeErrorResponse(StatusCodeFor(outcome.result.error), outcome.result.reason);
  }
  return outcome;
}

DeliveryResult TransferService::handleDownload(std::string_view method, std::string_view target, int outFd) const {
  const bool withBody = method == http::GET;
  if (!withBody && method != http::HEAD) {
    return sendError(outFd, http::StatusCodeMethodNotAllowed, true);
  }

  // Query and fragment do not designate the file.
  target = target.substr(0, target.find_first_of("?#"));
  const std::string_view prefix = _config.delivery.downloadPathPrefix;
  if (!target.starts_with(prefix)) {
    return sendError(outFd, http::StatusCodeNotFound, withBody);
  }
  const std::optional<std::string> relative = PercentDecode(target.substr(prefix.size()));
  if (!relative) {
    log::warn("Rejected download target '{}' with invalid percent-encoding", target);
    return sendError(outFd, http::StatusCodeBadRequest, withBody);
  }
  return _delivery.deliver(*relative, outFd, withBody);
}

DeliveryResult TransferService::sendError(int outFd, http::StatusCode status, bool withBody) const {
  DeliveryResult result;
  result.status = status;
  switch (status) {
    case http::StatusCodeNotFound:
      result.error = TransferError::NotFound;
      break;
    case http::StatusCodeBadRequest:
      result.error = TransferError::MalformedRequest;
      break;
    default:
      break;
  }
  TransferResponse response = MakeErrorResponse(status, {});
  if (status == http::StatusCodeMethodNotAllowed) {
    response.header("Allow", "GET, HEAD");
  }
  result.headSent = WriteFully(outFd, withBody ? response.serialize() : response.head(), _config.delivery.ioTimeout);
  if (!result.headSent) {
    result.sendCode = SendfileResult::Code::OutputError;
  }
  return result;
}

}  // namespace ferry
