#pragma once

#include <spdlog/version.h>

#include <format>
#include <string>
#include <string_view>

#ifndef FERRY_VERSION_STR
#error "FERRY_VERSION_STR must be defined via build system"
#endif

namespace ferry {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return FERRY_VERSION_STR; }

// Multiline description of the build:
//   ferry <version>
//     logging: spdlog <major>.<minor>.<patch>
inline std::string_view fullVersionStringView() {
  static const std::string kFullVersion = std::format("ferry {}\n  logging: spdlog {}.{}.{}", version(),
                                                      SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
  return kFullVersion;
}

}  // namespace ferry
