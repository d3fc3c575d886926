#pragma once

// Logging goes through spdlog. Call sites write log::info(...), log::error(...) etc.
// Header-only usage is forced locally, without exporting SPDLOG_HEADER_ONLY as a public
// compile definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace ferry {

namespace log = spdlog;

}  // namespace ferry
