#pragma once

#include <cstdint>
#include <string_view>

#include "ferry/http-status-code.hpp"

namespace ferry {

// Failure taxonomy of the ingestion engine and of the delivery path. Every error is scoped to a single request.
enum class TransferError : uint8_t {
  None,
  // Missing boundary parameter, first boundary never found or unparseable part headers. Nothing was written.
  MalformedRequest,
  // End of stream while expecting part headers or a closing boundary. Open destination files are closed, not deleted.
  IncompleteStream,
  // A destination file could not be created or written. Previously completed parts are kept.
  FilesystemError,
  // A decoded filename or a requested download path resolves outside of the storage root.
  PathTraversalRejected,
  // Requested download target does not exist or is not a regular file.
  NotFound,
  // Content type detection failed. Never fails a response: a generic binary type is used instead.
  ProbeFailure
};

std::string_view TransferErrorName(TransferError error) noexcept;

// HTTP status code reported to the client for 'error'.
http::StatusCode StatusCodeFor(TransferError error) noexcept;

}  // namespace ferry
