#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace roadnet::core {

// Library logger "roadnet" (stderr). Created on first use; SPDLOG_LEVEL in the
// environment is honored, e.g. SPDLOG_LEVEL=roadnet=debug.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace roadnet::core
