#pragma once

#include <spdlog/version.h>

#include <string_view>

#ifndef EMBER_VERSION_STR
#error "EMBER_VERSION_STR must be defined via build system"
#endif

#define EMBER_STRINGIFY_IMPL(x) #x
#define EMBER_STRINGIFY(x) EMBER_STRINGIFY_IMPL(x)

namespace ember {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return EMBER_VERSION_STR; }

// Multiline version string including the versions of the linked libraries:
//   ember <version>\n
//     logging: spdlog <major.minor.patch>
constexpr std::string_view fullVersionStringView() {
  return "ember " EMBER_VERSION_STR "\n  logging: spdlog " EMBER_STRINGIFY(SPDLOG_VER_MAJOR) "." EMBER_STRINGIFY(
      SPDLOG_VER_MINOR) "." EMBER_STRINGIFY(SPDLOG_VER_PATCH);
}

}  // namespace ember
