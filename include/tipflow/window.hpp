#pragma once

#include <cassert>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "common.hpp"

namespace tipflow {
/**
 * @brief Tumbling event-time window, left-closed right-open
 *
 * | Window end | Interval covered           |
 * |------------|----------------------------|
 * | 3600000    | [0, 3600000)               |
 * | 7200000    | [3600000, 7200000)         |
 *
 * Records produced for a window carry its end as their timestamp.
 */
struct time_window {
  millis start; ///< First timestamp in the window
  millis end;   ///< One past the last timestamp in the window

  constexpr bool contains(millis t) const noexcept { return start <= t && t < end; }
  constexpr millis size() const noexcept { return end - start; }

  friend constexpr bool operator==(time_window const &, time_window const &) noexcept = default;
};

/**
 * @brief Start of the tumbling window containing timestamp
 *
 * Floor division, so negative timestamps fall into the window on their left: with size 10, -1 maps to -10.
 */
constexpr millis window_start(millis timestamp, millis window_size) noexcept {
  assert(window_size > 0 && "[BUG] Window size must be positive.");
  auto remainder = timestamp % window_size;
  if (remainder < 0) {
    remainder += window_size;
  }
  return timestamp - remainder;
}

/**
 * @brief Assign a timestamp to its tumbling window
 *
 * Stateless and deterministic: the result depends on timestamp and window_size only. Caller ensures
 * min_assignable(window_size) <= timestamp <= max_assignable(window_size).
 */
constexpr time_window assign(millis timestamp, millis window_size) noexcept {
  auto const start = window_start(timestamp, window_size);
  return {start, start + window_size};
}

/// Smallest timestamp whose window start is still representable
constexpr millis min_assignable(millis window_size) noexcept { return min_time<millis>() + window_size; }

/// Largest timestamp whose window end is still representable
constexpr millis max_assignable(millis window_size) noexcept { return max_time<millis>() - window_size; }
} // namespace tipflow

template <>
struct fmt::formatter<tipflow::time_window> : fmt::formatter<std::string_view> {
  auto format(tipflow::time_window const &w, fmt::format_context &ctx) const {
    return fmt::format_to(ctx.out(), "[{}, {})", w.start, w.end);
  }
};
