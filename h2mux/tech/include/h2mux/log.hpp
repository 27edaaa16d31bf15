#pragma once

// Logging facade: all h2mux code logs through spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace h2mux {

namespace log = spdlog;

}  // namespace h2mux
