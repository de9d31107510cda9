#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common.hpp"
#include "record.hpp"
#include "window.hpp"

#include "detail/accum.hpp"
#include "detail/sorted_vect.hpp"

namespace tipflow {
/**
 * @brief Running tip sum per (window, driver)
 *
 * State is a map from window end to that window's key states plus a sorted set of pending window ends. Key
 * states of a window are kept in the order their driver was first seen, which fixes the order of drain().
 *
 * Not thread-safe: one stage owns an instance and serialises all updates.
 */
template <std::floating_point T>
class keyed_accumulator {
public:
  using data_type = T;
  using record_type = tip_record<T>;
  using accum_type = detail::accum<T>;

  /**
   * @brief Add a tip to the (window, driver) state, creating it on first use
   *
   * @throws std::overflow_error if the sum leaves the representable range, the state is left unchanged
   */
  void apply(time_window const &w, driver_id driver, data_type tip) {
    auto it = windows.find(w.end);
    if (it != windows.end()) {
      assert(it->second.start == w.start && "[BUG] Windows of different size share an end.");
      auto &state = it->second;
      if (auto pos = state.index.find(driver); pos != state.index.end()) {
        state.keys[pos->second].second.add(tip);
        return;
      }
    }

    accum_type init(tip); // may throw, nothing created yet
    if (it == windows.end()) {
      it = windows.try_emplace(w.end).first;
      it->second.start = w.start;
      pending.push(w.end);
    }
    auto &state = it->second;
    state.index.emplace(driver, state.keys.size());
    state.keys.emplace_back(driver, init);
  }

  /**
   * @brief Hand out and discard every key state of one window
   *
   * fn receives one record_type per driver, in first-seen order.
   *
   * @return number of records produced, 0 if the window has no state
   */
  template <typename Fn>
  size_t drain(millis window_end, Fn &&fn) {
    auto it = windows.find(window_end);
    if (it == windows.end()) {
      return 0;
    }
    auto state = std::move(it->second);
    windows.erase(it);
    pending.erase(window_end);

    for (auto const &[driver, sum] : state.keys) {
      fn(record_type{window_end, driver, sum.value()});
    }
    return state.keys.size();
  }

  /// Earliest window end with live state
  std::optional<millis> next_end() const noexcept {
    if (pending.empty()) {
      return std::nullopt;
    }
    return pending.front();
  }

  /// Current sum of a key, if the key has state
  std::optional<data_type> peek(millis window_end, driver_id driver) const {
    auto it = windows.find(window_end);
    if (it == windows.end()) {
      return std::nullopt;
    }
    auto pos = it->second.index.find(driver);
    if (pos == it->second.index.end()) {
      return std::nullopt;
    }
    return it->second.keys[pos->second].second.value();
  }

  size_t num_windows() const noexcept { return windows.size(); }

  size_t num_keys(millis window_end) const {
    auto it = windows.find(window_end);
    return it == windows.end() ? 0 : it->second.keys.size();
  }

  bool empty() const noexcept { return windows.empty(); }

  void clear() noexcept {
    windows.clear();
    pending.clear();
  }

private:
  struct window_state {
    millis start{};
    std::unordered_map<driver_id, size_t> index;           ///< driver -> position in keys
    std::vector<std::pair<driver_id, accum_type>> keys; ///< first-seen order
  };

  std::unordered_map<millis, window_state> windows;
  detail::sorted_vect<millis> pending;
};
} // namespace tipflow
