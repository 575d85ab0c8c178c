/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_Logger.cpp
 * @brief Unit tests for the logger, its handlers and timers
 */

#include <gtest/gtest.h>
#include "igak/Core/Logger.h"

#include <string>
#include <vector>

using namespace igak;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        saved_level_ = logger.get_level();
        logger.set_console_output(false);
        logger.clear_handlers();
        logger.add_handler([this](const LogMessage& msg) {
            levels_.push_back(msg.level);
            messages_.push_back(msg.message);
        });
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_handlers();
        logger.set_level(saved_level_);
        logger.set_console_output(true);
    }

    LogLevel saved_level_ = LogLevel::INFO;
    std::vector<LogLevel> levels_;
    std::vector<std::string> messages_;
};

} // namespace

TEST(LogLevelParsing, AcceptsNamesCaseInsensitively) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("Warn", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parse_log_level("OFF", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST(LogLevelParsing, RejectsUnknownName) {
    LogLevel level = LogLevel::ERROR;
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger::instance().set_level(LogLevel::WARNING);
    IGAK_LOG_INFO("dropped");
    IGAK_LOG_WARNING("kept warning");
    IGAK_LOG_ERROR("kept error");

    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(messages_[0], "kept warning");
    EXPECT_EQ(levels_[0], LogLevel::WARNING);
    EXPECT_EQ(levels_[1], LogLevel::ERROR);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().set_level(LogLevel::OFF);
    IGAK_LOG_ERROR("silent");
    IGAK_LOG_CRITICAL("silent");
    EXPECT_TRUE(messages_.empty());
}

TEST_F(LoggerTest, StreamLoggingFormatsValues) {
    Logger::instance().set_level(LogLevel::INFO);
    IGAK_INFO() << "assembled " << 42 << " entries";
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0], "assembled 42 entries");
}

TEST_F(LoggerTest, ScopedTimerLogsStartAndCompletion) {
    Logger::instance().set_level(LogLevel::INFO);
    {
        IGAK_TIMED_SCOPE("stiffness assembly");
    }
    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(messages_[0], "Starting: stiffness assembly");
    EXPECT_EQ(messages_[1].rfind("Completed: stiffness assembly (elapsed: ", 0), 0u);
}

TEST(Timer, ElapsedIsNonNegativeAndFrozenAfterStop) {
    Timer timer;
    timer.start();
    timer.stop();
    const double t = timer.elapsed();
    EXPECT_GE(t, 0.0);
    EXPECT_DOUBLE_EQ(timer.elapsed(), t);
}
