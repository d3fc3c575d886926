#include "ferry/transfer-error.hpp"

#include <string_view>

#include "ferry/http-status-code.hpp"

namespace ferry {

std::string_view TransferErrorName(TransferError error) noexcept {
  switch (error) {
    case TransferError::None:
      return "None";
    case TransferError::MalformedRequest:
      return "MalformedRequest";
    case TransferError::IncompleteStream:
      return "IncompleteStream";
    case TransferError::FilesystemError:
      return "FilesystemError";
    case TransferError::PathTraversalRejected:
      return "PathTraversalRejected";
    case TransferError::NotFound:
      return "NotFound";
    case TransferError::ProbeFailure:
      return "ProbeFailure";
    default:
      return "Unknown";
  }
}

http::StatusCode StatusCodeFor(TransferError error) noexcept {
  switch (error) {
    case TransferError::MalformedRequest:
      [[fallthrough]];
    case TransferError::IncompleteStream:
      return http::StatusCodeBadRequest;
    case TransferError::FilesystemError:
      return http::StatusCodeInternalServerError;
    case TransferError::PathTraversalRejected:
      return http::StatusCodeForbidden;
    case TransferError::NotFound:
      return http::StatusCodeNotFound;
    default:
      // ProbeFailure degrades to a generic content type and does not fail the response
      return http::StatusCodeOK;
  }
}

}  // namespace ferry
