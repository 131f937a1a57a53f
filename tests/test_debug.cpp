/**
 * @file test_debug.cpp
 * @brief Tests for logging helpers
 */

#include <gtest/gtest.h>
#include <string>
#include "layout-algebra/layout-algebra.hpp"

using namespace layout_algebra;

TEST(DebugTest, LogLevelNames) {
    EXPECT_STREQ(debug::get_log_level_name(debug::LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(debug::get_log_level_name(debug::LogLevel::INFO), "INFO");
    EXPECT_STREQ(debug::get_log_level_name(debug::LogLevel::WARNING), "WARNING");
    EXPECT_STREQ(debug::get_log_level_name(debug::LogLevel::ERROR), "ERROR");
}

TEST(DebugTest, FormatMessage) {
    EXPECT_EQ(debug::format_message("divide ", 12, " by ", 4), "divide 12 by 4");
    EXPECT_EQ(debug::format_message(Layout(IntTuple{4, 8}, IntTuple{1, 4})), "(4,8):(1,4)");
    EXPECT_EQ(debug::format_message(IntTuple{12, {4, 8}}, ":", IntTuple{59, {13, 1}}),
              "(12,(4,8)):(59,(13,1))");
}

TEST(DebugTest, FormatLogLine) {
    std::string line = debug::format_log_line(debug::LogLevel::WARNING, "layout.hpp", 42,
                                              "shape mismatch");
    EXPECT_EQ(line, "[WARNING] layout.hpp:42 - shape mismatch");
}

TEST(DebugTest, ErrorLogGoesToStderr) {
    ::testing::internal::CaptureStderr();
    LAYOUT_ERROR("cannot divide ", 12, " by ", 7);
    std::string output = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("[ERROR]"), std::string::npos);
    EXPECT_NE(output.find("cannot divide 12 by 7"), std::string::npos);
}

TEST(DebugTest, DebugLogFollowsBuildMode) {
    ::testing::internal::CaptureStderr();
    LAYOUT_DEBUG("parsed ", 8, ":", 1);
    std::string output = ::testing::internal::GetCapturedStderr();
    if (config::DEBUG_MODE) {
        EXPECT_NE(output.find("[DEBUG]"), std::string::npos);
    } else {
        EXPECT_TRUE(output.empty());
    }
}

TEST(DebugTest, Version) {
    EXPECT_EQ(version(), "1.0.0");
}
