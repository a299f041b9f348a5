#include <gtest/gtest.h>

#include <limits>

#include "steps/frame_time.hpp"

using steps::FrameClock;
using steps::FrameTimeHistory;

TEST(FrameClock, AdvanceAccumulatesTotal) {
    FrameClock clock;
    clock.Advance(0.25f);
    clock.Advance(0.5f);
    EXPECT_FLOAT_EQ(clock.delta, 0.5f);
    EXPECT_FLOAT_EQ(clock.total, 0.75f);
}

TEST(FrameClock, UpdateIsNonNegative) {
    FrameClock clock;
    clock.Update();
    clock.Update();
    EXPECT_GE(clock.delta, 0.0f);
    EXPECT_GE(clock.total, clock.delta);
}

TEST(FrameTimeHistory, EmptyStatsAreZero) {
    FrameTimeHistory h;
    EXPECT_EQ(h.Size(), 0u);
    EXPECT_FLOAT_EQ(h.Average(), 0.0f);
    EXPECT_FLOAT_EQ(h.Percentile(0.95f), 0.0f);
}

TEST(FrameTimeHistory, AverageAndPercentiles) {
    FrameTimeHistory h;
    // pushed out of order on purpose
    for (int i = 100; i >= 1; --i) h.Push(static_cast<float>(i));
    EXPECT_FLOAT_EQ(h.Average(), 50.5f);
    EXPECT_FLOAT_EQ(h.Percentile(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(h.Percentile(0.5f), 51.0f);
    EXPECT_FLOAT_EQ(h.Percentile(0.95f), 96.0f);
}

TEST(FrameTimeHistory, PercentileIndexIsClamped) {
    FrameTimeHistory h;
    h.Push(1.0f);
    h.Push(2.0f);
    h.Push(3.0f);
    EXPECT_FLOAT_EQ(h.Percentile(1.0f), 3.0f);
    EXPECT_FLOAT_EQ(h.Percentile(2.0f), 3.0f);
    EXPECT_FLOAT_EQ(h.Percentile(-1.0f), 1.0f);
}

TEST(FrameTimeHistory, NaNPercentileIsMinimum) {
    FrameTimeHistory h;
    h.Push(3.0f);
    h.Push(1.0f);
    h.Push(2.0f);
    EXPECT_FLOAT_EQ(h.Percentile(std::numeric_limits<float>::quiet_NaN()), 1.0f);
}

TEST(FrameTimeHistory, KeepsLastFiveHundred) {
    FrameTimeHistory h;
    for (int i = 0; i < 600; ++i) h.Push(i < 100 ? 1000.0f : 1.0f);
    EXPECT_EQ(h.Size(), FrameTimeHistory::kCapacity);
    EXPECT_FLOAT_EQ(h.Average(), 1.0f);
}

TEST(FrameTitle, FormatsMilliseconds) {
    FrameTimeHistory h;
    h.Push(0.016f);
    h.Push(0.017f);
    h.Push(0.018f);
    EXPECT_EQ(steps::FormatFrameTitle(h), "Frame time: 17.00ms (95th: 18.00ms, 99th: 18.00ms)");
}

TEST(FrameTitle, EmptyHistory) {
    EXPECT_EQ(steps::FormatFrameTitle(FrameTimeHistory{}), "Frame time: 0.00ms (95th: 0.00ms, 99th: 0.00ms)");
}
