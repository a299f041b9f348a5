#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>

#include "steps/log.hpp"

using steps::log::Level;

namespace {

// Restores the global level after each test.
class LogTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = steps::log::GetLevel(); }
    void TearDown() override {
        steps::log::SetLevel(saved_);
        unsetenv("STEPS_LOG");
    }

private:
    Level saved_ = Level::Info;
};

} // namespace

TEST_F(LogTest, ParseLevelNames) {
    Level l = Level::Info;
    EXPECT_TRUE(steps::log::ParseLevel("error", &l));
    EXPECT_EQ(l, Level::Error);
    EXPECT_TRUE(steps::log::ParseLevel("Warn", &l));
    EXPECT_EQ(l, Level::Warn);
    EXPECT_TRUE(steps::log::ParseLevel("warning", &l));
    EXPECT_EQ(l, Level::Warn);
    EXPECT_TRUE(steps::log::ParseLevel("INFO", &l));
    EXPECT_EQ(l, Level::Info);
    EXPECT_TRUE(steps::log::ParseLevel("debug", &l));
    EXPECT_EQ(l, Level::Debug);
}

TEST_F(LogTest, ParseLevelRejectsUnknown) {
    Level l = Level::Warn;
    EXPECT_FALSE(steps::log::ParseLevel("verbose", &l));
    EXPECT_FALSE(steps::log::ParseLevel("", &l));
    EXPECT_EQ(l, Level::Warn);
}

TEST_F(LogTest, ThresholdFiltersLevels) {
    steps::log::SetLevel(Level::Warn);
    EXPECT_TRUE(steps::log::Enabled(Level::Error));
    EXPECT_TRUE(steps::log::Enabled(Level::Warn));
    EXPECT_FALSE(steps::log::Enabled(Level::Info));
    EXPECT_FALSE(steps::log::Enabled(Level::Debug));
}

TEST_F(LogTest, DisabledStreamSwallowsOutput) {
    steps::log::SetLevel(Level::Error);
    std::ostream& out = steps::log::Debug("test");
    out << "not shown " << 42 << "\n";
    EXPECT_TRUE(out.good());
}

TEST_F(LogTest, EnvironmentSetsLevel) {
    setenv("STEPS_LOG", "debug", 1);
    steps::log::SetLevel(Level::Info);
    steps::log::InitFromEnvironment();
    EXPECT_EQ(steps::log::GetLevel(), Level::Debug);
}

TEST_F(LogTest, UnknownEnvironmentValueIsIgnored) {
    setenv("STEPS_LOG", "chatty", 1);
    steps::log::SetLevel(Level::Warn);
    steps::log::InitFromEnvironment();
    EXPECT_EQ(steps::log::GetLevel(), Level::Warn);
}
