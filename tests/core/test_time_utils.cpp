#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "hedge_ngin/core/time_utils.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_localtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_GE(result.tm_mon, 0);
    EXPECT_LE(result.tm_mon, 11);
}

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;
    ASSERT_NE(safe_gmtime(&epoch, &result), nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
}

TEST_F(TimeUtilsTest, FormattedTimeMatchesPattern) {
    std::string formatted = get_formatted_time("%Y%m%d_%H%M%S", false);
    EXPECT_TRUE(std::regex_match(formatted, std::regex("\\d{8}_\\d{6}")));
}

TEST_F(TimeUtilsTest, DaysFromCivil) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
}

TEST_F(TimeUtilsTest, ParseAndFormatDate) {
    auto parsed = parse_date("2024-02-29");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_date(*parsed), "2024-02-29");
    EXPECT_EQ(format_date(add_days(*parsed, 1)), "2024-03-01");
}

TEST_F(TimeUtilsTest, ParseRejectsInvalidDates) {
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
    EXPECT_FALSE(parse_date("2024-13-01").has_value());
    EXPECT_FALSE(parse_date("2024-1-05").has_value());
    EXPECT_FALSE(parse_date("2024-01-05x").has_value());
    EXPECT_FALSE(parse_date("").has_value());
    EXPECT_FALSE(parse_date("not-a-date").has_value());
}

TEST_F(TimeUtilsTest, Iso8601KeepsMilliseconds) {
    auto day = *parse_date("2024-01-02");
    auto ts = day + std::chrono::hours(13) + std::chrono::minutes(5) +
              std::chrono::milliseconds(42);
    EXPECT_EQ(format_iso8601(ts), "2024-01-02T13:05:00.042Z");
}

TEST_F(TimeUtilsTest, TruncatesToUtcDay) {
    auto day = *parse_date("2024-06-30");
    auto afternoon = day + std::chrono::hours(15) + std::chrono::minutes(30);
    EXPECT_EQ(to_utc_day(afternoon), day);
    EXPECT_EQ(to_utc_day(day), day);

    auto before_epoch = *parse_date("1969-12-31") + std::chrono::hours(5);
    EXPECT_EQ(format_date(to_utc_day(before_epoch)), "1969-12-31");
}
