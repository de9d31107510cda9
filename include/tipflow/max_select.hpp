#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <optional>
#include <unordered_map>

#include "common.hpp"
#include "log.hpp"
#include "record.hpp"

#include "detail/sorted_vect.hpp"

namespace tipflow {
/**
 * @brief Per-window maximum over all drivers
 *
 * Second stage of the pipeline. Records are grouped by window_end alone, i.e. all drivers of a window are
 * compared together. Only the running best of each group is kept.
 *
 * Tie-break: a record replaces the current best only if its tip_sum is strictly greater, so among equal sums
 * the first record to arrive wins.
 *
 * A group is emitted once the watermark reaches its window_end, which is the same closure condition the
 * emitter applies upstream. Feeding the records of a window before the watermark that closed it therefore
 * guarantees the group is complete when it fires.
 */
template <std::floating_point T>
class max_selector {
public:
  using data_type = T;
  using record_type = tip_record<T>;

  /**
   * @brief Add a record to its window group
   *
   * @return false if the group was already emitted, the record is dropped
   */
  bool on_record(record_type const &r) {
    if (r.window_end <= wm) {
      ++dropped;
      logger()->debug("max_selector: dropped {} for closed window", r);
      return false;
    }
    auto [it, fresh] = best.try_emplace(r.window_end, r);
    if (fresh) {
      pending.push(r.window_end);
    } else if (r.tip_sum > it->second.tip_sum) {
      it->second = r;
    }
    return true;
  }

  /**
   * @brief Emit the winner of every group with window_end <= watermark
   *
   * @return number of records emitted
   */
  template <typename Fn>
  size_t on_watermark(millis watermark, Fn &&out) {
    if (watermark > wm) {
      wm = watermark;
    }
    size_t n = 0;
    while (!pending.empty() && pending.front() <= wm) {
      auto const end = pending.front();
      pending.pop_front();
      auto node = best.extract(end);
      assert(!node.empty() && "[BUG] Pending window without a group.");
      logger()->debug("max_selector: window ending {} won by {}", end, node.mapped());
      out(node.mapped());
      ++n;
    }
    return n;
  }

  /// Current best of an open group
  std::optional<record_type> peek(millis window_end) const {
    auto it = best.find(window_end);
    if (it == best.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  millis watermark() const noexcept { return wm; }
  size_t num_pending() const noexcept { return pending.size(); }
  size_t num_dropped() const noexcept { return dropped; }

private:
  std::unordered_map<millis, record_type> best;
  detail::sorted_vect<millis> pending;
  millis wm = min_time<millis>();
  size_t dropped = 0;
};
} // namespace tipflow
