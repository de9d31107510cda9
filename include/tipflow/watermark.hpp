#pragma once

#include <atomic>

#include "common.hpp"
#include "window.hpp"

#include "detail/utils.hpp"

namespace tipflow {
/**
 * @brief Monotone event-time progress
 *
 * current = max(current, event_time - out_of_orderness) over all observed events. With out_of_orderness == 0
 * this is the monotonous-timestamp strategy: the watermark is the largest event time seen so far. A window is
 * closed once the watermark reaches its end.
 *
 * Updates are a lock-free max-merge so one writer and any number of readers (or several writers) may share
 * an instance; readers always see a value that some update produced.
 */
class alignas(detail::cacheline_size) watermark {
public:
  explicit watermark(millis out_of_orderness = 0) noexcept : value(min_time<millis>()), bound(out_of_orderness) {}

  watermark(watermark const &) = delete;
  watermark &operator=(watermark const &) = delete;

  /**
   * @brief Account for an event timestamp
   *
   * @return watermark after the update, never smaller than before
   */
  millis observe(millis event_time) noexcept {
    // saturate instead of underflowing near min_time
    auto const t = event_time < min_time<millis>() + bound ? min_time<millis>() : event_time - bound;
    return advance(t);
  }

  /// Max-merge t into the watermark, returns the new value
  millis advance(millis t) noexcept {
    auto cur = value.load(std::memory_order::relaxed);
    while (cur < t && !value.compare_exchange_weak(cur, t, std::memory_order::release, std::memory_order::relaxed)) {
    }
    return cur < t ? t : cur;
  }

  millis current() const noexcept { return value.load(std::memory_order::acquire); }

  bool passed(time_window const &w) const noexcept { return current() >= w.end; }
  bool passed(millis window_end) const noexcept { return current() >= window_end; }

  millis out_of_orderness() const noexcept { return bound; }

  void reset() noexcept { value.store(min_time<millis>(), std::memory_order::release); }

private:
  std::atomic<millis> value;
  millis const bound;
};
} // namespace tipflow
