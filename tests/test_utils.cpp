/**
 * @file test_utils.cpp
 * @brief Unit tests for logging, timing and numeric helpers
 */

#include <gtest/gtest.h>
#include <smcpso/smcpso.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace smcpso::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setOutputCallback([this](LogLevel level, const char* message) {
            levels_.push_back(level);
            messages_.emplace_back(message);
        });
    }

    void TearDown() override {
        Logger::instance().setOutputCallback(nullptr);
        Logger::instance().setLevel(LogLevel::Info);
    }

    std::vector<LogLevel> levels_;
    std::vector<std::string> messages_;
};

TEST_F(LoggerTest, FormatsMessage) {
    Logger::instance().setLevel(LogLevel::Info);
    SMCPSO_LOG_INFO("best cost %.2f after %d iterations", 1.5, 12);

    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0], "best cost 1.50 after 12 iterations");
    EXPECT_EQ(levels_[0], LogLevel::Info);
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger::instance().setLevel(LogLevel::Warning);
    SMCPSO_LOG_DEBUG("hidden");
    SMCPSO_LOG_INFO("hidden");
    SMCPSO_LOG_WARNING("shown");
    SMCPSO_LOG_ERROR("shown");

    EXPECT_EQ(messages_.size(), 2u);
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::Info));
    EXPECT_TRUE(Logger::instance().isEnabled(LogLevel::Error));

    Logger::instance().setLevel(LogLevel::Off);
    SMCPSO_LOG_FATAL("hidden");
    EXPECT_EQ(messages_.size(), 2u);
}

TEST(MathUtilsTest, Sign) {
    EXPECT_DOUBLE_EQ(sign(3.0), 1.0);
    EXPECT_DOUBLE_EQ(sign(-0.1), -1.0);
    EXPECT_DOUBLE_EQ(sign(0.0), 0.0);
}

TEST(MathUtilsTest, Saturate) {
    EXPECT_DOUBLE_EQ(saturate(200.0, 150.0), 150.0);
    EXPECT_DOUBLE_EQ(saturate(-200.0, 150.0), -150.0);
    EXPECT_DOUBLE_EQ(saturate(12.5, 150.0), 12.5);
}

TEST(MathUtilsTest, SafeNormalize) {
    EXPECT_DOUBLE_EQ(safeNormalize(4.0, 2.0, 1e-12), 2.0);
    EXPECT_DOUBLE_EQ(safeNormalize(4.0, 1e-15, 1e-12), 4.0);
    EXPECT_DOUBLE_EQ(safeNormalize(4.0, 0.0, 1e-12), 4.0);
}

TEST(MathUtilsTest, AllFinite) {
    EXPECT_TRUE(allFinite(std::vector<double>{1.0, -2.0, 0.0}));
    EXPECT_FALSE(allFinite(std::vector<double>{1.0, std::nan("")}));
    EXPECT_FALSE(allFinite(std::vector<double>{std::numeric_limits<double>::infinity()}));
}

TEST(RingBufferTest, OverwriteKeepsNewest) {
    RingBuffer<double> buffer(3);
    EXPECT_TRUE(buffer.empty());

    for (double v : {5.0, 1.0, 2.0, 3.0}) {
        buffer.pushOverwrite(v);
    }
    EXPECT_TRUE(buffer.full());
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_DOUBLE_EQ(buffer[0], 1.0);
    EXPECT_DOUBLE_EQ(buffer[2], 3.0);
    EXPECT_DOUBLE_EQ(buffer.max(), 3.0);

    EXPECT_FALSE(buffer.push(4.0));
    EXPECT_DOUBLE_EQ(buffer[0], 1.0);

    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_DOUBLE_EQ(buffer.max(), 0.0);
}

TEST(ElapsedTimerTest, Budget) {
    ElapsedTimer timer;
    EXPECT_FALSE(timer.isRunning());
    timer.start();
    EXPECT_TRUE(timer.isRunning());
    EXPECT_FALSE(timer.hasExpired(0.0));
    EXPECT_FALSE(timer.hasExpired(3600.0));

    timer.stop();
    EXPECT_FALSE(timer.isRunning());
    EXPECT_GE(timer.getElapsedSec(), 0.0);
}

TEST(VersionTest, String) {
    EXPECT_STREQ(smcpso::getVersion(), "1.0.0");
    EXPECT_EQ(smcpso::Version::MAJOR, 1);
}
