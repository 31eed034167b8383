#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace ember {

// Components without an injected logger go through spdlog's default logger.
namespace log = spdlog;

}  // namespace ember
