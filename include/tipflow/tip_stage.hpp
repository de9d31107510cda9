#pragma once

#include <concepts>

#include "config.hpp"
#include "emitter.hpp"
#include "fare.hpp"
#include "keyed_accum.hpp"
#include "log.hpp"
#include "stats.hpp"
#include "watermark.hpp"
#include "window.hpp"

namespace tipflow {
/**
 * @brief First pipeline stage: validate, assign, accumulate and emit per-driver window sums
 *
 * Per fare:
 *   1. validate, invalid fares are counted and dropped
 *   2. assign the tumbling window; if the watermark has already passed its end the fare is late and dropped
 *   3. add the tip to the (window, driver) state
 *   4. advance the watermark and emit every window it has now passed
 *
 * Late policy: a window is final once closed. A fare for a closed window never reopens it, so records that
 * have left the stage are never revised.
 */
template <std::floating_point T>
class tip_stage {
public:
  using data_type = T;
  using fare_type = fare_event<T>;
  using record_type = tip_record<T>;

  explicit tip_stage(pipeline_config const &cfg)
      : size(checked_size(cfg)), wm(cfg.lag_millis()), acc(), emitter(acc), counters() {}

  tip_stage(tip_stage const &) = delete;
  tip_stage &operator=(tip_stage const &) = delete;

  /**
   * @brief Ingest one fare
   *
   * @param out receives the records of every window closed by this fare
   * @throws std::overflow_error if a tip sum leaves the representable range
   */
  template <typename Fn>
  fare_status on_fare(fare_type const &f, Fn &&out) {
    auto const status = validate(f, size);
    if (status != fare_status::ok) {
      counters.count(status);
      logger()->debug("rejected fare of driver {} at {}: {}", f.driver, f.event_time, to_string(status));
      return status;
    }

    auto const w = assign(f.event_time, size);
    if (wm.passed(w)) {
      counters.count(fare_status::late);
      logger()->debug("dropped late fare of driver {} at {}, window {} closed at watermark {}", f.driver,
                      f.event_time, w, wm.current());
      return fare_status::late;
    }

    acc.apply(w, f.driver, f.tip);
    counters.count(fare_status::ok);
    close(wm.observe(f.event_time), out);
    return fare_status::ok;
  }

  /// Count a line that could not be parsed
  void on_malformed() noexcept { counters.count(fare_status::malformed); }

  /// End of stream: raise the watermark to max_time and emit all remaining windows
  template <typename Fn>
  void finish(Fn &&out) {
    close(wm.advance(max_time<millis>()), out);
  }

  millis watermark() const noexcept { return wm.current(); }
  millis window_size() const noexcept { return size; }
  keyed_accumulator<T> const &state() const noexcept { return acc; }
  pipeline_stats const &stats() const noexcept { return counters; }

private:
  static millis checked_size(pipeline_config const &cfg) {
    cfg.validate();
    return cfg.window_millis();
  }

  template <typename Fn>
  void close(millis now, Fn &&out) {
    counters.windows_closed += emitter.on_watermark(now, out);
    counters.records_emitted = emitter.records_emitted();
  }

  millis const size;
  tipflow::watermark wm;
  keyed_accumulator<T> acc;
  window_emitter<T> emitter;
  pipeline_stats counters;
};
} // namespace tipflow
