#pragma once

#include <atomic>
#include <concepts>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

#include "config.hpp"
#include "fare.hpp"
#include "log.hpp"
#include "max_select.hpp"
#include "record.hpp"
#include "stats.hpp"
#include "tip_stage.hpp"

#include "detail/channel.hpp"
#include "detail/utils.hpp"

namespace tipflow {
/**
 * @brief Hourly top-tipped driver, one worker thread per stage
 *
 *   caller --push()--> [fares] --> tip_stage worker --> [records, watermarks] --> max_selector worker --> sink
 *
 * Both channels are bounded, so a slow stage blocks its producer. The first worker forwards a watermark after
 * the records it released for that watermark; channel order makes it the closure barrier of the selector.
 * All key state lives in the first worker, the sink is called on the second worker.
 *
 * If a worker throws (e.g. tip sum overflow) the pipeline stops: channels are closed, push() returns false and
 * finish() rethrows the first exception on the caller thread.
 */
template <std::floating_point T>
class staged_runner {
public:
  using data_type = T;
  using fare_type = fare_event<T>;
  using record_type = tip_record<T>;
  using sink_type = std::function<void(record_type const &)>;

  staged_runner(pipeline_config const &cfg, sink_type sink)
      : stage(cfg), selector(), sink(std::move(sink)), input(cfg.channel_capacity), links(cfg.channel_capacity) {
    logger()->info("staged_runner: window {}ms, out of orderness {}ms, channel capacity {}", cfg.window_millis(),
                   cfg.lag_millis(), cfg.channel_capacity);
    second = std::thread([this] { run_second(); });
    try {
      first = std::thread([this] { run_first(); });
    } catch (...) {
      // second would wait on links forever
      links.close();
      second.join();
      throw;
    }
  }

  staged_runner(staged_runner const &) = delete;
  staged_runner &operator=(staged_runner const &) = delete;

  ~staged_runner() {
    input.close();
    join();
  }

  /**
   * @brief Hand a fare to the first stage, blocks while its channel is full
   *
   * @return false if the pipeline is stopped (finished or failed), the fare is discarded
   */
  bool push(fare_type const &f) { return input.push(f); }

  /**
   * @brief Signal end of stream, wait for every window to be emitted
   *
   * @throws the first exception raised by a worker
   */
  void finish() {
    input.close();
    join();
    if (error) {
      std::rethrow_exception(error);
    }
    auto const s = stats();
    logger()->info("staged_runner: finished, {} accepted, {} late, {} rejected, {} windows, {} maxima", s.accepted,
                   s.late, s.rejected(), s.windows_closed, s.maxima_emitted);
  }

  /// Only consistent once finish() has returned
  pipeline_stats stats() const noexcept {
    auto s = stage.stats();
    s.maxima_emitted = maxima.load(std::memory_order::acquire);
    return s;
  }

  bool failed() const noexcept { return stopped.load(std::memory_order::acquire); }

private:
  struct watermark_mark {
    millis value;
  };
  using link_type = std::variant<record_type, watermark_mark>;

  /// End of the first stage's output, on every exit path of run_first()
  struct close_on_exit {
    detail::channel<link_type> &ch;
    ~close_on_exit() { ch.close(); }
  };

  void run_first() {
    close_on_exit done{links};
    try {
      bool blocked = false;
      auto forward = [this, &blocked](record_type const &r) {
        if (!links.push(r)) {
          blocked = true;
        }
      };
      millis forwarded = min_time<millis>();
      auto forward_watermark = [&] {
        auto const now = stage.watermark();
        if (now > forwarded && !blocked) {
          forwarded = now;
          blocked = !links.push(watermark_mark{now});
        }
      };

      while (auto f = input.pop()) {
        if (stage.on_fare(*f, forward) == fare_status::ok) {
          forward_watermark();
        }
        if (blocked) {
          return;
        }
      }
      if (!stopped.load(std::memory_order::acquire)) {
        stage.finish(forward);
        forward_watermark();
      }
    } catch (std::exception const &e) {
      fail("tip_stage", e.what(), std::current_exception());
    } catch (...) {
      fail("tip_stage", "unknown exception", std::current_exception());
    }
  }

  void run_second() {
    try {
      auto emit = [this](record_type const &r) {
        sink(r);
        maxima.fetch_add(1, std::memory_order::release);
      };
      while (auto msg = links.pop()) {
        std::visit(detail::overload{[this](record_type const &r) { selector.on_record(r); },
                                    [&](watermark_mark const &m) { selector.on_watermark(m.value, emit); }},
                   *msg);
      }
    } catch (std::exception const &e) {
      fail("max_selector", e.what(), std::current_exception());
    } catch (...) {
      fail("max_selector", "unknown exception", std::current_exception());
    }
  }

  void fail(char const *where, char const *what, std::exception_ptr e) {
    logger()->error("staged_runner: {} worker stopped: {}", where, what);
    {
      std::lock_guard lock(mtx);
      if (!error) {
        error = std::move(e);
      }
    }
    stopped.store(true, std::memory_order::release);
    input.close();
    links.close();
  }

  void join() {
    if (first.joinable()) {
      first.join();
    }
    if (second.joinable()) {
      second.join();
    }
  }

  tip_stage<T> stage;
  max_selector<T> selector;
  sink_type sink;

  detail::channel<fare_type> input;
  detail::channel<link_type> links;

  std::thread first;
  std::thread second;

  std::atomic<std::uint64_t> maxima{0};
  std::atomic<bool> stopped{false};
  std::mutex mtx;
  std::exception_ptr error;
};
} // namespace tipflow
