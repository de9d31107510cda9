#pragma once

#include <concepts>
#include <ostream>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "common.hpp"

namespace tipflow {
/**
 * @brief Tip total of one driver in one window
 *
 * Output of the window emitter (one per driver and window) and of the max selector (one per window).
 */
template <std::floating_point T>
struct tip_record {
  using data_type = T;

  millis window_end; ///< End of the window the sum covers
  driver_id driver;
  data_type tip_sum;

  friend bool operator==(tip_record const &, tip_record const &) noexcept = default;
};

using hourly_tip = tip_record<double>;

template <std::floating_point T>
std::string to_string(tip_record<T> const &r) {
  return fmt::format("({},{},{:.2f})", r.window_end, r.driver, r.tip_sum);
}

template <std::floating_point T>
std::ostream &operator<<(std::ostream &os, tip_record<T> const &r) {
  return os << to_string(r);
}
} // namespace tipflow

template <std::floating_point T>
struct fmt::formatter<tipflow::tip_record<T>> : fmt::formatter<std::string_view> {
  auto format(tipflow::tip_record<T> const &r, fmt::format_context &ctx) const {
    return fmt::format_to(ctx.out(), "({},{},{:.2f})", r.window_end, r.driver, r.tip_sum);
  }
};
