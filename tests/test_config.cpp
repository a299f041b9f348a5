#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "steps/config.hpp"

using steps::AppConfig;

namespace {

AppConfig Parse(std::vector<const char*> args) {
    args.insert(args.begin(), "steps");
    return steps::ParseArgs(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(Config, Defaults) {
    AppConfig c = Parse({});
    EXPECT_EQ(c.title, "WGPU Engine");
    EXPECT_EQ(c.width, 800u);
    EXPECT_EQ(c.height, 600u);
    EXPECT_EQ(c.minWidth, 400u);
    EXPECT_EQ(c.minHeight, 300u);
    EXPECT_EQ(c.resizeDebounce.count(), 100);
    EXPECT_TRUE(c.texturePath.empty());
    EXPECT_FALSE(c.presentMode.has_value());
    EXPECT_EQ(c.logLevel, steps::log::Level::Info);
    EXPECT_FALSE(c.showHelp);
}

TEST(Config, ParsesAllFlags) {
    AppConfig c = Parse({"--title", "Hello", "--width", "1280", "--height", "720",
                         "--min-width", "640", "--min-height", "360", "--debounce-ms", "250",
                         "--texture", "stone.png", "--present-mode", "mailbox", "--log-level", "DEBUG"});
    EXPECT_EQ(c.title, "Hello");
    EXPECT_EQ(c.width, 1280u);
    EXPECT_EQ(c.height, 720u);
    EXPECT_EQ(c.minWidth, 640u);
    EXPECT_EQ(c.minHeight, 360u);
    EXPECT_EQ(c.resizeDebounce.count(), 250);
    EXPECT_EQ(c.texturePath, "stone.png");
    ASSERT_TRUE(c.presentMode.has_value());
    EXPECT_EQ(*c.presentMode, wgpu::PresentMode::Mailbox);
    EXPECT_EQ(c.logLevel, steps::log::Level::Debug);
}

TEST(Config, ZeroDebounceIsAllowed) {
    EXPECT_EQ(Parse({"--debounce-ms", "0"}).resizeDebounce.count(), 0);
}

TEST(Config, HelpFlag) {
    EXPECT_TRUE(Parse({"--help"}).showHelp);
    EXPECT_TRUE(Parse({"-h"}).showHelp);
}

TEST(Config, PresentModeNames) {
    EXPECT_EQ(*Parse({"--present-mode", "fifo"}).presentMode, wgpu::PresentMode::Fifo);
    EXPECT_EQ(*Parse({"--present-mode", "fifo-relaxed"}).presentMode, wgpu::PresentMode::FifoRelaxed);
    EXPECT_EQ(*Parse({"--present-mode", "immediate"}).presentMode, wgpu::PresentMode::Immediate);
}

TEST(Config, RejectsBadInput) {
    EXPECT_THROW(Parse({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--width"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--width", "abc"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--width", "0"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--height", "-5"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--width", "99999"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--debounce-ms", "-1"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--present-mode", "vsync"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--log-level", "loud"}), std::invalid_argument);
}

TEST(Config, MinimumAboveSizeIsRejected) {
    EXPECT_THROW(Parse({"--width", "300"}), std::invalid_argument);
    EXPECT_NO_THROW(Parse({"--width", "300", "--min-width", "300"}));
}

TEST(Config, ErrorNamesTheFlag) {
    try {
        Parse({"--min-height", "x"});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("--min-height"), std::string::npos);
    }
}

TEST(Config, UsageListsFlags) {
    const std::string usage = steps::Usage("demo");
    EXPECT_NE(usage.find("Usage: demo"), std::string::npos);
    EXPECT_NE(usage.find("--debounce-ms"), std::string::npos);
    EXPECT_NE(usage.find("--present-mode"), std::string::npos);
}
