/// @file logging_test.cpp
/// @brief Tests for SkyRCA logging utilities

#include <gtest/gtest.h>

#include "common/logging.h"

namespace skyrca {
namespace {

TEST(LoggingTest, InitializeLogging) {
    LogConfig config;
    config.name = "skyrca-test";
    config.level = LogLevel::kDebug;

    EXPECT_NO_THROW(InitLogging(config));
    EXPECT_NE(GetLogger(), nullptr);
}

TEST(LoggingTest, LogLevelChange) {
    InitLogging();

    EXPECT_NO_THROW(SetLogLevel(LogLevel::kWarn));
    EXPECT_NO_THROW(SetLogLevel(LogLevel::kDebug));
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::kTrace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::kOff);
    EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel("verbose", LogLevel::kWarn), LogLevel::kWarn);
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    EXPECT_NO_THROW({
        SKYRCA_LOG_TRACE("Trace message: {}", 1);
        SKYRCA_LOG_DEBUG("Debug message: {}", 2);
        SKYRCA_LOG_INFO("Info message: {}", 3);
        SKYRCA_LOG_WARN("Warn message: {}", 4);
        SKYRCA_LOG_ERROR("Error message: {}", 5);
    });
}

TEST(LoggingTest, FlushLogs) {
    InitLogging();
    SKYRCA_LOG_INFO("Test message");
    EXPECT_NO_THROW(FlushLogs());
}

}  // namespace
}  // namespace skyrca
