#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>

#include "common.hpp"

namespace tipflow {
struct pipeline_config {
  std::chrono::milliseconds window_size{std::chrono::hours(1)}; ///< Tumbling window length
  std::chrono::milliseconds out_of_orderness{0}; ///< Watermark lag behind the largest event time
  size_t channel_capacity{1024};                 ///< Per-channel bound of the staged runner

  /// @throws std::invalid_argument on an unusable configuration
  void validate() const {
    if (window_size.count() <= 0) {
      throw std::invalid_argument("pipeline_config: window_size must be positive");
    }
    if (out_of_orderness.count() < 0) {
      throw std::invalid_argument("pipeline_config: out_of_orderness must not be negative");
    }
    if (channel_capacity == 0) {
      throw std::invalid_argument("pipeline_config: channel_capacity must be positive");
    }
  }

  millis window_millis() const noexcept { return static_cast<millis>(window_size.count()); }
  millis lag_millis() const noexcept { return static_cast<millis>(out_of_orderness.count()); }
};
} // namespace tipflow
