/**
 * @file test_format_tools.cpp
 * @brief Tests for timestamp and countdown formatting.
 */
#include "utils/format_tools.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <regex>

using namespace zonechat::format_tools;

TEST(FormatToolsTest, FormattedTimeShape)
{
    const std::string s = formatted_time(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(s, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})")))
        << s;
}

TEST(FormatToolsTest, FormattedTimeMicroseconds)
{
    const auto tp = std::chrono::system_clock::time_point(std::chrono::microseconds(1000123));
    const std::string s = formatted_time(tp);
    EXPECT_EQ(s.substr(s.size() - 7), ".000123");
}

// ============================================================================
// Countdown
// ============================================================================

TEST(FormatToolsTest, CountdownMinutesSeconds)
{
    EXPECT_EQ(format_countdown(65000), "01:05");
    EXPECT_EQ(format_countdown(59 * 60 * 1000 + 59000), "59:59");
}

TEST(FormatToolsTest, CountdownWithHours)
{
    EXPECT_EQ(format_countdown(2 * 3600 * 1000), "02:00:00");
    EXPECT_EQ(format_countdown(3600 * 1000 + 61000), "01:01:01");
}

TEST(FormatToolsTest, CountdownRoundsPartialSecondUp)
{
    EXPECT_EQ(format_countdown(1), "00:01");
    EXPECT_EQ(format_countdown(999), "00:01");
    EXPECT_EQ(format_countdown(1001), "00:02");
}

TEST(FormatToolsTest, CountdownClampsAtZero)
{
    EXPECT_EQ(format_countdown(0), "00:00");
    EXPECT_EQ(format_countdown(-5000), "00:00");
}
