#pragma once

#include <concepts>
#include <functional>
#include <string_view>
#include <utility>

#include "config.hpp"
#include "fare.hpp"
#include "log.hpp"
#include "max_select.hpp"
#include "record.hpp"
#include "stats.hpp"
#include "tip_stage.hpp"

namespace tipflow {
/**
 * @brief Hourly top-tipped driver, single threaded
 *
 * Chains tip_stage into max_selector on the caller thread. After each accepted fare the records released by
 * the first stage are grouped, then the first stage's watermark is forwarded, so the selector only fires for
 * windows whose records are all in.
 *
 * Example:
 *   window_size = 1h, fares (driver, tip, t): (1, 5.0, 0), (2, 3.0, 100), (1, 2.0, 200), (2, 1.0, 3600000)
 *   - the fourth fare moves the watermark to 3600000 and closes [0, 3600000)
 *   - per-driver records (3600000,1,7.00), (3600000,2,3.00) reach the selector
 *   - the sink receives (3600000,1,7.00)
 *   - finish() closes [3600000, 7200000) and the sink receives (7200000,2,1.00)
 */
template <std::floating_point T>
class hourly_tips {
public:
  using data_type = T;
  using fare_type = fare_event<T>;
  using record_type = tip_record<T>;
  using sink_type = std::function<void(record_type const &)>;

  hourly_tips(pipeline_config const &cfg, sink_type sink) : stage(cfg), selector(), sink(std::move(sink)), maxima() {
    logger()->info("hourly_tips: window {}ms, out of orderness {}ms", cfg.window_millis(), cfg.lag_millis());
  }

  hourly_tips(hourly_tips const &) = delete;
  hourly_tips &operator=(hourly_tips const &) = delete;

  /// @throws std::overflow_error if a tip sum leaves the representable range
  fare_status on_fare(fare_type const &f) {
    auto const status = stage.on_fare(f, [this](record_type const &r) { selector.on_record(r); });
    if (status == fare_status::ok) {
      forward_watermark();
    }
    return status;
  }

  /// Parse a CSV line (see parse_fare()) and ingest it
  fare_status on_line(std::string_view line) {
    fare_type f{};
    if (parse_fare(line, f) != fare_status::ok) {
      stage.on_malformed();
      logger()->debug("rejected malformed line '{}'", line);
      return fare_status::malformed;
    }
    return on_fare(f);
  }

  /// Flush every open window, fares ingested afterwards are late
  void finish() {
    stage.finish([this](record_type const &r) { selector.on_record(r); });
    forward_watermark();
    auto const s = stats();
    logger()->info("hourly_tips: finished, {} accepted, {} late, {} rejected, {} windows, {} maxima", s.accepted,
                   s.late, s.rejected(), s.windows_closed, s.maxima_emitted);
  }

  pipeline_stats stats() const noexcept {
    auto s = stage.stats();
    s.maxima_emitted = maxima;
    return s;
  }

  millis watermark() const noexcept { return stage.watermark(); }
  tip_stage<T> const &first_stage() const noexcept { return stage; }
  max_selector<T> const &second_stage() const noexcept { return selector; }

private:
  void forward_watermark() {
    maxima += selector.on_watermark(stage.watermark(), [this](record_type const &r) { sink(r); });
  }

  tip_stage<T> stage;
  max_selector<T> selector;
  sink_type sink;
  std::uint64_t maxima;
};
} // namespace tipflow
