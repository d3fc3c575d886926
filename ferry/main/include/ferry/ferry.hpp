// ferry Umbrella Header
//
// Include this single header to pull in the public API of the transfer engine:
//   - TransferService, owning storage, caches and worker pool
//   - the multipart ingestion engine (MultipartStreamController and its byte sources)
//   - the zero-copy delivery path (FileDelivery, ContentTypeCache)
//   - configuration, error taxonomy and progress types
//
// Each re-exported header line is annotated with IWYU pragma: export so that symbols they provide are treated as
// satisfied when only <ferry/ferry.hpp> is included. Include the individual headers instead for finer control.

#pragma once

// Service
#include "ferry/transfer-service.hpp"  // IWYU pragma: export
#include "ferry/worker-pool.hpp"       // IWYU pragma: export

// Ingestion and delivery
#include "ferry/boundary.hpp"                     // IWYU pragma: export
#include "ferry/byte-source.hpp"                  // IWYU pragma: export
#include "ferry/content-type-cache.hpp"           // IWYU pragma: export
#include "ferry/fd-byte-source.hpp"               // IWYU pragma: export
#include "ferry/file-delivery.hpp"                // IWYU pragma: export
#include "ferry/filename-decoder.hpp"             // IWYU pragma: export
#include "ferry/multipart-stream-controller.hpp"  // IWYU pragma: export
#include "ferry/storage-root.hpp"                 // IWYU pragma: export

// Configuration
#include "ferry/delivery-config.hpp"          // IWYU pragma: export
#include "ferry/storage-config.hpp"           // IWYU pragma: export
#include "ferry/transfer-service-config.hpp"  // IWYU pragma: export
#include "ferry/upload-config.hpp"            // IWYU pragma: export

// Results and helpers
#include "ferry/http-constants.hpp"     // IWYU pragma: export
#include "ferry/http-status-code.hpp"   // IWYU pragma: export
#include "ferry/progress.hpp"           // IWYU pragma: export
#include "ferry/transfer-error.hpp"     // IWYU pragma: export
#include "ferry/transfer-response.hpp"  // IWYU pragma: export
#include "ferry/version.hpp"            // IWYU pragma: export
