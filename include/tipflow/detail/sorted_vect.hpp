#pragma once

#include <algorithm>
#include <cassert>
#include <iterator>
#include <vector>

namespace tipflow::detail {
/**
 * @brief Ascending vector of unique values
 *
 * Holds the pending window ends of a stage. Insertions are expected near the back (event time is mostly
 * increasing) and removals at the front (windows close in order), so a linear scan from the back beats
 * binary search below BIN_THRES elements.
 */
template <typename T, size_t BIN_THRES = 100, typename Alloc = std::allocator<T>>
class sorted_vect : public std::vector<T, Alloc> {
  using base = std::vector<T, Alloc>;
  using base::push_back;

public:
  using base::base;
  using typename base::difference_type;
  using typename base::size_type;

  bool contains(T const &value) const {
    if (base::size() > BIN_THRES) {
      return std::binary_search(base::begin(), base::end(), value);
    }
    return std::find(base::rbegin(), base::rend(), value) != base::rend();
  }

  /// Insert value keeping order, returns false if already present
  bool push(T const &value) {
    auto it = base::end();
    if (base::size() > BIN_THRES) {
      it = std::lower_bound(base::begin(), base::end(), value);
    } else {
      while (it != base::begin() && *std::prev(it) >= value) {
        --it;
      }
    }
    if (it != base::end() && *it == value) {
      return false;
    }
    base::insert(it, value);
    return true;
  }

  T const &front() const noexcept {
    assert(!base::empty() && "[BUG] front() on empty sorted_vect.");
    return base::front();
  }

  void pop_front() noexcept {
    assert(!base::empty() && "[BUG] pop_front() on empty sorted_vect.");
    base::erase(base::begin());
  }

  void erase(T const &value) {
    auto it = std::lower_bound(base::begin(), base::end(), value);
    if (it != base::end() && *it == value) {
      base::erase(it);
    }
  }
};
} // namespace tipflow::detail
