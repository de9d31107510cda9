#pragma once

#include <concepts>
#include <cstddef>

#include "common.hpp"
#include "keyed_accum.hpp"
#include "log.hpp"

namespace tipflow {
/**
 * @brief Emits the per-driver sums of every window the watermark has passed
 *
 * Windows are closed in increasing end order. Each closed window yields one record per driver that has state
 * in it, then its state is discarded. A window that never received an accepted fare has no state and yields
 * nothing.
 */
template <std::floating_point T>
class window_emitter {
public:
  using data_type = T;
  using record_type = tip_record<T>;

  explicit window_emitter(keyed_accumulator<T> &acc) noexcept : acc(acc) {}

  /**
   * @brief Close all windows with end <= wm
   *
   * @param wm  current watermark
   * @param out called with each record_type, grouped by window
   * @return number of windows closed
   */
  template <typename Fn>
  size_t on_watermark(millis wm, Fn &&out) {
    size_t closed = 0;
    for (auto end = acc.next_end(); end && *end <= wm; end = acc.next_end()) {
      auto const n = acc.drain(*end, out);
      logger()->debug("window ending {} closed at watermark {} with {} drivers", *end, wm, n);
      emitted += n;
      last_closed = *end;
      ++closed;
    }
    return closed;
  }

  /// End of the most recently closed window, min_time if none
  millis closed_through() const noexcept { return last_closed; }

  size_t records_emitted() const noexcept { return emitted; }

private:
  keyed_accumulator<T> &acc;
  millis last_closed = min_time<millis>();
  size_t emitted = 0;
};
} // namespace tipflow
