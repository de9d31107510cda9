#pragma once

#include <cstdint>
#include <limits>
#include <type_traits>

namespace tipflow {
using millis = std::int64_t;    ///< Epoch milliseconds, event time
using driver_id = std::int64_t; ///< Driver identifier, grouping key of the first stage

template <typename Time>
constexpr Time min_time() noexcept {
  if constexpr (std::is_arithmetic_v<Time>) {
    return std::numeric_limits<Time>::lowest();
  } else {
    return Time::min(); // Use min time for non-arithmetic types
  }
}

template <typename Time>
constexpr Time max_time() noexcept {
  if constexpr (std::is_arithmetic_v<Time>) {
    return std::numeric_limits<Time>::max();
  } else {
    return Time::max(); // Use max time for non-arithmetic types
  }
}
} // namespace tipflow
