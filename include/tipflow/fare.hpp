#pragma once

#include <array>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "common.hpp"
#include "window.hpp"

namespace tipflow {
/**
 * @brief A single taxi fare
 *
 * Only driver, tip and event_time take part in the aggregation. The remaining fields are carried through
 * from the TaxiFare CSV layout and are zero when the short layout is parsed.
 */
template <std::floating_point T>
struct fare_event {
  using data_type = T;

  driver_id driver;
  data_type tip;
  millis event_time;

  std::int64_t ride_id{};
  std::int64_t taxi_id{};
  data_type total_fare{};
};

using fare = fare_event<double>;

/// Outcome of ingesting a fare
enum class fare_status : std::uint8_t {
  ok,                ///< accepted into window state
  late,              ///< window already closed, dropped
  negative_tip,      ///< tip < 0
  invalid_tip,       ///< tip is NaN or infinite
  invalid_timestamp, ///< window bounds of the timestamp are not representable
  malformed,         ///< line could not be parsed
};

constexpr std::string_view to_string(fare_status s) noexcept {
  switch (s) {
  case fare_status::ok:
    return "ok";
  case fare_status::late:
    return "late";
  case fare_status::negative_tip:
    return "negative_tip";
  case fare_status::invalid_tip:
    return "invalid_tip";
  case fare_status::invalid_timestamp:
    return "invalid_timestamp";
  case fare_status::malformed:
    return "malformed";
  }
  return "unknown";
}

/// Check a fare before it may touch any window state
template <std::floating_point T>
fare_status validate(fare_event<T> const &f, millis window_size) noexcept {
  if (!std::isfinite(f.tip)) {
    return fare_status::invalid_tip;
  }
  if (f.tip < T{}) {
    return fare_status::negative_tip;
  }
  if (f.event_time < min_assignable(window_size) || f.event_time > max_assignable(window_size)) {
    return fare_status::invalid_timestamp;
  }
  return fare_status::ok;
}

namespace detail {
constexpr std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view ws = " \t\r\n";
  auto const first = s.find_first_not_of(ws);
  if (first == std::string_view::npos) {
    return {};
  }
  auto const last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

template <typename U>
bool parse_field(std::string_view s, U &out) noexcept {
  s = trim(s);
  if (s.empty()) {
    return false;
  }
  if (s.front() == '+') {
    s.remove_prefix(1);
  }
  auto const *end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

/// Split on ',' into at most N fields, returns number of fields or N + 1 if there are more
template <size_t N>
size_t split_csv(std::string_view line, std::array<std::string_view, N> &fields) noexcept {
  size_t n = 0;
  while (true) {
    auto const pos = line.find(',');
    if (n == N) {
      return N + 1;
    }
    fields[n++] = line.substr(0, pos);
    if (pos == std::string_view::npos) {
      return n;
    }
    line.remove_prefix(pos + 1);
  }
}
} // namespace detail

/**
 * @brief Parse one CSV line into a fare
 *
 * Accepted layouts, startTime in epoch milliseconds:
 *
 * | Fields | Layout                                                             |
 * |--------|--------------------------------------------------------------------|
 * | 8      | rideId,taxiId,driverId,startTime,paymentType,tip,tolls,totalFare   |
 * | 3      | driverId,startTime,tip                                             |
 *
 * Only the syntax is checked here, use validate() for value constraints.
 *
 * @return fare_status::ok and out filled, or fare_status::malformed with out untouched
 */
template <std::floating_point T>
fare_status parse_fare(std::string_view line, fare_event<T> &out) noexcept {
  std::array<std::string_view, 8> f;
  fare_event<T> tmp{};

  switch (detail::split_csv(detail::trim(line), f)) {
  case 8: {
    T tolls{};
    if (!detail::parse_field(f[0], tmp.ride_id) || !detail::parse_field(f[1], tmp.taxi_id) ||
        !detail::parse_field(f[2], tmp.driver) || !detail::parse_field(f[3], tmp.event_time) ||
        !detail::parse_field(f[5], tmp.tip) || !detail::parse_field(f[6], tolls) ||
        !detail::parse_field(f[7], tmp.total_fare)) {
      return fare_status::malformed;
    }
    break;
  }
  case 3:
    if (!detail::parse_field(f[0], tmp.driver) || !detail::parse_field(f[1], tmp.event_time) ||
        !detail::parse_field(f[2], tmp.tip)) {
      return fare_status::malformed;
    }
    break;
  default:
    return fare_status::malformed;
  }

  out = tmp;
  return fare_status::ok;
}
} // namespace tipflow
