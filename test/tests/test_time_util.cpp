#include <gtest/gtest.h>
#include "hacklog.hpp"

class TimeUtilTest : public ::testing::Test {};

TEST_F(TimeUtilTest, FormatIsoUtc) {
    EXPECT_EQ(hacklog::formatIsoUtc(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(hacklog::formatIsoUtc(1735787045123LL), "2025-01-02T03:04:05.123Z");
    EXPECT_EQ(hacklog::formatIsoUtc(-1), "1969-12-31T23:59:59.999Z");
}

TEST_F(TimeUtilTest, FormatRfc3339DropsMillis) {
    EXPECT_EQ(hacklog::formatRfc3339Seconds(1735787045999LL), "2025-01-02T03:04:05Z");
}

TEST_F(TimeUtilTest, NsToIsoTruncatesToMillis) {
    std::string out;
    ASSERT_TRUE(hacklog::nsToIso("1767065448866999999", out));
    EXPECT_EQ(out, "2025-12-30T03:30:48.866Z");
    ASSERT_TRUE(hacklog::nsToIso("42", out));
    EXPECT_EQ(out, "1970-01-01T00:00:00.000Z");
}

TEST_F(TimeUtilTest, NsToIsoRejectsGarbage) {
    std::string out = "untouched";
    EXPECT_FALSE(hacklog::nsToIso("", out));
    EXPECT_FALSE(hacklog::nsToIso("12ab", out));
    EXPECT_FALSE(hacklog::nsToIso("99999999999999999999999999", out));
    EXPECT_EQ(out, "untouched");
}

TEST_F(TimeUtilTest, IsoTimestampPrefix) {
    EXPECT_EQ(hacklog::matchIsoTimestampPrefix("2025-01-02T03:04:05.123456789Z rest"), 30u);
    EXPECT_EQ(hacklog::matchIsoTimestampPrefix("2025-01-02T03:04:05Z"), 20u);
    EXPECT_EQ(hacklog::matchIsoTimestampPrefix("2025-01-02T03:04:05"), 0u);
    EXPECT_EQ(hacklog::matchIsoTimestampPrefix("2025-01-02T03:04:05.Z"), 0u);
    EXPECT_EQ(hacklog::matchIsoTimestampPrefix("hello"), 0u);
}

TEST_F(TimeUtilTest, IsoToClock) {
    EXPECT_EQ(hacklog::isoToClock("2025-12-30T03:30:48.866Z"), "03:30:48.866");
    EXPECT_EQ(hacklog::isoToClock("2025-12-30T03:30:48.8Z"), "03:30:48.800");
    EXPECT_EQ(hacklog::isoToClock("2025-12-30T03:30:48Z"), "03:30:48");
    EXPECT_EQ(hacklog::isoToClock("not a time"), "not a time");
}

TEST_F(TimeUtilTest, ParseDuration) {
    int64_t ms = 0;
    EXPECT_TRUE(hacklog::parseDurationMs("15m", ms));
    EXPECT_EQ(ms, 900000);
    EXPECT_TRUE(hacklog::parseDurationMs("24h", ms));
    EXPECT_EQ(ms, 86400000);
    EXPECT_TRUE(hacklog::parseDurationMs("7 D", ms));
    EXPECT_EQ(ms, 7 * 86400000LL);
    EXPECT_TRUE(hacklog::parseDurationMs("2w", ms));
    EXPECT_EQ(ms, 14 * 86400000LL);
    EXPECT_FALSE(hacklog::parseDurationMs("0s", ms));
    EXPECT_FALSE(hacklog::parseDurationMs("h", ms));
    EXPECT_FALSE(hacklog::parseDurationMs("5y", ms));
    EXPECT_FALSE(hacklog::parseDurationMs("-5m", ms));
}

TEST_F(TimeUtilTest, ParseIsoInstantWithZone) {
    int64_t ms = 0;
    ASSERT_TRUE(hacklog::parseIsoInstant("2025-01-02", ms));
    EXPECT_EQ(ms, 1735776000000LL);
    ASSERT_TRUE(hacklog::parseIsoInstant("2025-01-02T03:04:05Z", ms));
    EXPECT_EQ(ms, 1735787045000LL);
    ASSERT_TRUE(hacklog::parseIsoInstant("2025-01-02T03:04:05.5Z", ms));
    EXPECT_EQ(ms, 1735787045500LL);
    ASSERT_TRUE(hacklog::parseIsoInstant("2025-01-02T05:04:05+02:00", ms));
    EXPECT_EQ(ms, 1735787045000LL);
    ASSERT_TRUE(hacklog::parseIsoInstant("2025-01-02T01:04:05-0200", ms));
    EXPECT_EQ(ms, 1735787045000LL);
}

TEST_F(TimeUtilTest, ParseIsoInstantRejectsMalformed) {
    int64_t ms = 0;
    EXPECT_FALSE(hacklog::parseIsoInstant("2025-13-02", ms));
    EXPECT_FALSE(hacklog::parseIsoInstant("2025-01-02T25:00:00Z", ms));
    EXPECT_FALSE(hacklog::parseIsoInstant("2025/01/02", ms));
    EXPECT_FALSE(hacklog::parseIsoInstant("2025-01-02T03:04:05Q", ms));
}

TEST_F(TimeUtilTest, ParseTimeInput) {
    const int64_t now = 1735787045000LL;
    int64_t ms = 0;
    ASSERT_TRUE(hacklog::parseTimeInput("now", now, ms));
    EXPECT_EQ(ms, now);
    ASSERT_TRUE(hacklog::parseTimeInput(" 15m ", now, ms));
    EXPECT_EQ(ms, now - 900000);
    ASSERT_TRUE(hacklog::parseTimeInput("2025-01-02", now, ms));
    EXPECT_EQ(ms, 1735776000000LL);
    EXPECT_FALSE(hacklog::parseTimeInput("", now, ms));
    EXPECT_FALSE(hacklog::parseTimeInput("yesterday", now, ms));
}
