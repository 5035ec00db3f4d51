#pragma once

// Logging abstraction: courier logs through spdlog's default logger.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace courier {

namespace log = spdlog;

}  // namespace courier
