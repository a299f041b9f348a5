#include <gtest/gtest.h>

#include <sstream>

#include "steps/size.hpp"

using steps::FramebufferSize;
using steps::LogicalSize;

TEST(FramebufferSize, EmptyWhenEitherSideIsZero) {
    EXPECT_TRUE((FramebufferSize{0, 600}).IsEmpty());
    EXPECT_TRUE((FramebufferSize{800, 0}).IsEmpty());
    EXPECT_FALSE((FramebufferSize{800, 600}).IsEmpty());
}

TEST(FramebufferSize, Prints) {
    std::ostringstream out;
    out << FramebufferSize{1280, 720};
    EXPECT_EQ(out.str(), "1280x720");
}

// --- UI layout ---

TEST(LogicalSize, FollowsFrameBufferNotWindow) {
    // frame buffer still at the old size while the window has grown
    const LogicalSize s = steps::ToLogical({800, 600}, 1.0f);
    EXPECT_FLOAT_EQ(s.width, 800.0f);
    EXPECT_FLOAT_EQ(s.height, 600.0f);
}

TEST(LogicalSize, DividesByScale) {
    const LogicalSize s = steps::ToLogical({2560, 1440}, 2.0f);
    EXPECT_FLOAT_EQ(s.width, 1280.0f);
    EXPECT_FLOAT_EQ(s.height, 720.0f);
    // points times scale lands back on the frame buffer
    EXPECT_FLOAT_EQ(s.width * 2.0f, 2560.0f);
}

TEST(LogicalSize, NonPositiveScaleCountsAsOne) {
    const LogicalSize zero = steps::ToLogical({640, 480}, 0.0f);
    EXPECT_FLOAT_EQ(zero.width, 640.0f);
    const LogicalSize negative = steps::ToLogical({640, 480}, -2.0f);
    EXPECT_FLOAT_EQ(negative.height, 480.0f);
}
