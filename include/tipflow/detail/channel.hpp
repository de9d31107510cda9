#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tipflow::detail {
/**
 * @brief Bounded blocking FIFO between two pipeline stages
 *
 * push() blocks while the channel is full (backpressure), pop() blocks while it is empty. After close(), push()
 * fails and pop() drains the remaining items before reporting end of stream.
 */
template <typename T>
class channel {
public:
  explicit channel(size_t capacity) : cap(capacity) {}

  channel(channel const &) = delete;
  channel &operator=(channel const &) = delete;

  /// @return false if the channel was closed, item is discarded
  bool push(T item) {
    std::unique_lock lock(mtx);
    not_full.wait(lock, [this] { return closed || buf.size() < cap; });
    if (closed) {
      return false;
    }
    buf.push_back(std::move(item));
    lock.unlock();
    not_empty.notify_one();
    return true;
  }

  /// @return nullopt once the channel is closed and drained
  std::optional<T> pop() {
    std::unique_lock lock(mtx);
    not_empty.wait(lock, [this] { return closed || !buf.empty(); });
    if (buf.empty()) {
      return std::nullopt;
    }
    std::optional<T> out(std::move(buf.front()));
    buf.pop_front();
    lock.unlock();
    not_full.notify_one();
    return out;
  }

  void close() noexcept {
    {
      std::lock_guard lock(mtx);
      closed = true;
    }
    not_empty.notify_all();
    not_full.notify_all();
  }

  bool is_closed() const {
    std::lock_guard lock(mtx);
    return closed;
  }

  size_t size() const {
    std::lock_guard lock(mtx);
    return buf.size();
  }

  size_t capacity() const noexcept { return cap; }

private:
  size_t const cap;
  mutable std::mutex mtx;
  std::condition_variable not_empty;
  std::condition_variable not_full;
  std::deque<T> buf;
  bool closed = false;
};
} // namespace tipflow::detail
