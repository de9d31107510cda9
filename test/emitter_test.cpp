#include <gtest/gtest.h>
#include <vector>

#include "tipflow/emitter.hpp"

namespace {
using namespace tipflow;

constexpr millis hour = 3'600'000;

class WindowEmitterTest : public ::testing::Test {
protected:
  using record_type = tip_record<double>;

  size_t close(millis wm) {
    return emitter.on_watermark(wm, [this](record_type const &r) { out.push_back(r); });
  }

  keyed_accumulator<double> acc;
  window_emitter<double> emitter{acc};
  std::vector<record_type> out;
};

TEST_F(WindowEmitterTest, NothingBeforeWindowEnd) {
  acc.apply(assign(0, hour), 1, 5.0);
  EXPECT_EQ(close(hour - 1), 0u);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(emitter.closed_through(), min_time<millis>());
}

TEST_F(WindowEmitterTest, EmitsOneRecordPerDriverAtWindowEnd) {
  auto const w = assign(0, hour);
  acc.apply(w, 1, 5.0);
  acc.apply(w, 2, 3.0);
  acc.apply(w, 1, 2.0);

  EXPECT_EQ(close(hour), 1u);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], (record_type{hour, 1, 7.0}));
  EXPECT_EQ(out[1], (record_type{hour, 2, 3.0}));
  EXPECT_EQ(emitter.closed_through(), hour);
  EXPECT_EQ(emitter.records_emitted(), 2u);
  EXPECT_TRUE(acc.empty());
}

TEST_F(WindowEmitterTest, ClosesSeveralWindowsInOrder) {
  acc.apply(assign(3 * hour + 1, hour), 3, 1.0);
  acc.apply(assign(1, hour), 1, 1.0);
  acc.apply(assign(hour + 1, hour), 2, 1.0);

  EXPECT_EQ(close(10 * hour), 3u);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].window_end, hour);
  EXPECT_EQ(out[1].window_end, 2 * hour);
  EXPECT_EQ(out[2].window_end, 4 * hour);
}

TEST_F(WindowEmitterTest, EmptyWindowsEmitNothing) {
  acc.apply(assign(1, hour), 1, 1.0);
  acc.apply(assign(5 * hour + 1, hour), 1, 1.0);

  // windows ending at 2h..5h never received a fare
  EXPECT_EQ(close(6 * hour), 2u);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].window_end, hour);
  EXPECT_EQ(out[1].window_end, 6 * hour);
}

TEST_F(WindowEmitterTest, ClosedWindowIsNotEmittedTwice) {
  acc.apply(assign(0, hour), 1, 1.0);
  close(hour);
  close(hour);
  close(2 * hour);
  EXPECT_EQ(out.size(), 1u);
}
} // namespace
