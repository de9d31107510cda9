#pragma once

#include <memory>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "def.hpp"

namespace tipflow {
/**
 * @brief Library logger
 *
 * Returns the logger registered as TIPFLOW_LOGGER_NAME, creating a coloured stderr logger on first use. An
 * application may register its own logger under that name before the first call to redirect library output.
 */
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> const instance = [] {
    if (auto existing = spdlog::get(TIPFLOW_LOGGER_NAME)) {
      return existing;
    }
    return spdlog::stderr_color_mt(TIPFLOW_LOGGER_NAME);
  }();
  return instance;
}

inline void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }
} // namespace tipflow
