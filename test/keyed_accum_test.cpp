#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <vector>

#include "tipflow/keyed_accum.hpp"

namespace {
using namespace tipflow;

constexpr millis hour = 3'600'000;

class KeyedAccumulatorTest : public ::testing::Test {
protected:
  using acc_type = keyed_accumulator<double>;
  using record_type = acc_type::record_type;

  std::vector<record_type> drain(millis end) {
    std::vector<record_type> out;
    acc.drain(end, [&](record_type const &r) { out.push_back(r); });
    return out;
  }

  acc_type acc;
};

TEST_F(KeyedAccumulatorTest, CreatesThenAdds) {
  auto const w = assign(0, hour);
  acc.apply(w, 1, 5.0);
  EXPECT_DOUBLE_EQ(acc.peek(hour, 1).value(), 5.0);

  acc.apply(w, 1, 2.0);
  EXPECT_DOUBLE_EQ(acc.peek(hour, 1).value(), 7.0);
  EXPECT_FALSE(acc.peek(hour, 2).has_value());
  EXPECT_FALSE(acc.peek(2 * hour, 1).has_value());
  EXPECT_EQ(acc.num_keys(hour), 1u);
}

TEST_F(KeyedAccumulatorTest, KeysAreSeparatedByWindow) {
  acc.apply(assign(10, hour), 1, 1.0);
  acc.apply(assign(hour + 10, hour), 1, 2.0);
  acc.apply(assign(20, hour), 2, 3.0);

  EXPECT_EQ(acc.num_windows(), 2u);
  EXPECT_EQ(acc.num_keys(hour), 2u);
  EXPECT_EQ(acc.num_keys(2 * hour), 1u);
  EXPECT_DOUBLE_EQ(acc.peek(hour, 1).value(), 1.0);
  EXPECT_DOUBLE_EQ(acc.peek(2 * hour, 1).value(), 2.0);
}

TEST_F(KeyedAccumulatorTest, NextEndIsEarliestPendingWindow) {
  EXPECT_FALSE(acc.next_end().has_value());

  acc.apply(assign(2 * hour + 5, hour), 1, 1.0);
  acc.apply(assign(5, hour), 1, 1.0); // older window arrives later
  EXPECT_EQ(acc.next_end(), hour);

  drain(hour);
  EXPECT_EQ(acc.next_end(), 3 * hour);
}

TEST_F(KeyedAccumulatorTest, DrainInFirstSeenOrderAndDiscards) {
  auto const w = assign(0, hour);
  acc.apply(w, 4, 1.0);
  acc.apply(w, 3, 1.0);
  acc.apply(w, 9, 1.0);
  acc.apply(w, 3, 1.0);

  auto out = drain(hour);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0], (record_type{hour, 4, 1.0}));
  EXPECT_EQ(out[1], (record_type{hour, 3, 2.0}));
  EXPECT_EQ(out[2], (record_type{hour, 9, 1.0}));

  EXPECT_TRUE(acc.empty());
  EXPECT_TRUE(drain(hour).empty());
}

TEST_F(KeyedAccumulatorTest, SumIndependentOfArrivalOrder) {
  std::mt19937 gen(2024);
  std::uniform_real_distribution<double> tip(0.0, 20.0);
  std::uniform_int_distribution<driver_id> driver(1, 25);

  struct item {
    driver_id d;
    double tip;
  };
  std::vector<item> items(2000);
  for (auto &i : items) {
    i = {driver(gen), tip(gen)};
  }

  auto const w = assign(0, hour);
  auto sums = [&] {
    acc_type a;
    for (auto const &i : items) {
      a.apply(w, i.d, i.tip);
    }
    std::vector<record_type> out;
    a.drain(hour, [&](record_type const &r) { out.push_back(r); });
    std::sort(out.begin(), out.end(), [](auto const &l, auto const &r) { return l.driver < r.driver; });
    return out;
  };

  auto const reference = sums();
  for (int round = 0; round < 5; ++round) {
    std::shuffle(items.begin(), items.end(), gen);
    EXPECT_EQ(sums(), reference);
  }
}

TEST_F(KeyedAccumulatorTest, OverflowLeavesStateUntouched) {
  auto const w = assign(0, hour);
  acc.apply(w, 1, 9.0e12);
  EXPECT_THROW(acc.apply(w, 1, 9.0e12), std::overflow_error);
  EXPECT_DOUBLE_EQ(acc.peek(hour, 1).value(), 9.0e12);

  // no state is created for a tip that cannot be represented
  EXPECT_THROW(acc.apply(assign(hour, hour), 2, 1.0e300), std::overflow_error);
  EXPECT_EQ(acc.num_windows(), 1u);
  EXPECT_EQ(acc.next_end(), hour);
}

TEST_F(KeyedAccumulatorTest, ManyDistinctKeys) {
  auto const w = assign(0, hour);
  for (driver_id d = 0; d < 10000; ++d) {
    acc.apply(w, d, 0.5);
  }
  EXPECT_EQ(acc.num_keys(hour), 10000u);
  EXPECT_EQ(drain(hour).size(), 10000u);
}

TEST_F(KeyedAccumulatorTest, Clear) {
  acc.apply(assign(0, hour), 1, 1.0);
  acc.clear();
  EXPECT_TRUE(acc.empty());
  EXPECT_FALSE(acc.next_end().has_value());
}
} // namespace
