#include "roadnet/core/log.hpp"

#include <mutex>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace roadnet::core {

namespace {
constexpr const char* kLoggerName = "roadnet";
std::once_flag g_init;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::call_once(g_init, [] {
    if (!spdlog::get(kLoggerName)) {
      auto lg = spdlog::stderr_color_mt(kLoggerName);
      lg->set_level(spdlog::level::info);
    }
    spdlog::cfg::load_env_levels();
  });
  auto lg = spdlog::get(kLoggerName);
  // The host application may drop our logger from the registry.
  return lg ? lg : spdlog::default_logger();
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace roadnet::core
