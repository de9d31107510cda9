#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace tipflow::detail {
/**
 * @brief Exact decimal accumulator
 *
 * Values are rounded to fixed-point units of 1/Scale and summed as 64-bit integers, so the sum is independent
 * of the order of additions. Leaving the representable range throws std::overflow_error instead of wrapping.
 *
 * @tparam T     floating point type seen by callers
 * @tparam Scale fixed-point units per 1.0, default keeps 6 decimal places
 */
template <std::floating_point T, std::int64_t Scale = 1'000'000>
class accum {
  static_assert(Scale > 0, "accum: Scale must be positive");

  std::int64_t units{};

  static std::int64_t to_units(T x) {
    T const scaled = std::round(x * static_cast<T>(Scale));
    // 2^63 is exactly representable, anything at or beyond it does not fit
    constexpr T limit = static_cast<T>(std::numeric_limits<std::int64_t>::max());
    if (!std::isfinite(scaled) || scaled >= limit || scaled < -limit) {
      throw std::overflow_error("accum: value out of fixed-point range");
    }
    return static_cast<std::int64_t>(scaled);
  }

  static std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    constexpr auto lo = std::numeric_limits<std::int64_t>::min();
    constexpr auto hi = std::numeric_limits<std::int64_t>::max();
    if ((b > 0 && a > hi - b) || (b < 0 && a < lo - b)) {
      throw std::overflow_error("accum: sum overflow");
    }
    return a + b;
  }

public:
  accum() noexcept = default;
  explicit accum(T x) : units(to_units(x)) {}

  void add(T x) { units = checked_add(units, to_units(x)); }

  T value() const noexcept { return static_cast<T>(units) / static_cast<T>(Scale); }
  operator T() const noexcept { return value(); }

  std::int64_t raw() const noexcept { return units; }

  accum &operator=(T x) {
    units = to_units(x);
    return *this;
  }

  void reset() noexcept { units = 0; }
};
} // namespace tipflow::detail
