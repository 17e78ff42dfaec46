// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <chrono>

namespace ctxmem {
namespace {

TEST(TimestampTest, DefaultIsZero) {
    Timestamp ts;
    EXPECT_TRUE(ts.IsZero());
    EXPECT_EQ(0, ts.ToMicros());
}

TEST(TimestampTest, NowIsNotZero) {
    Timestamp ts = Timestamp::Now();
    EXPECT_FALSE(ts.IsZero());
}

TEST(TimestampTest, MicrosRoundTrip) {
    Timestamp ts = Timestamp::FromMicros(1700000000123456);
    EXPECT_EQ(1700000000123456, ts.ToMicros());
}

TEST(TimestampTest, ArithmeticWithDurations) {
    Timestamp base = Timestamp::FromMicros(1000000000000);
    Timestamp later = base + std::chrono::hours(2);

    EXPECT_GT(later, base);
    EXPECT_EQ(std::chrono::hours(2), later - base);
    EXPECT_EQ(base, later - std::chrono::hours(2));
}

TEST(TimestampTest, FractionalDurations) {
    Timestamp base = Timestamp::FromMicros(1000000000000);
    Timestamp later = base + std::chrono::duration<double>(1.5);
    EXPECT_EQ(1500000, (later - base).count());
}

TEST(TimestampTest, ComparisonOperators) {
    Timestamp a = Timestamp::FromMicros(100);
    Timestamp b = Timestamp::FromMicros(200);
    Timestamp c = Timestamp::FromMicros(100);

    EXPECT_EQ(a, c);
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
    EXPECT_GT(b, a);
    EXPECT_LE(a, c);
    EXPECT_GE(b, a);
}

TEST(TimestampTest, ToStringIsIsoUtc) {
    Timestamp ts = Timestamp::FromMicros(0);
    EXPECT_EQ("1970-01-01T00:00:00.000000Z", ts.ToString());

    Timestamp later = Timestamp::FromMicros(86400LL * 1000000 + 1500);
    EXPECT_EQ("1970-01-02T00:00:00.001500Z", later.ToString());
}

TEST(TimestampTest, HourOfDayInRange) {
    int hour = Timestamp::Now().HourOfDay();
    EXPECT_GE(hour, 0);
    EXPECT_LE(hour, 23);
}

TEST(ElapsedTest, SecondsHoursDays) {
    Timestamp earlier = Timestamp::FromMicros(1000000000000);
    Timestamp later = earlier + std::chrono::hours(36);

    EXPECT_DOUBLE_EQ(36.0 * 3600.0, SecondsBetween(later, earlier));
    EXPECT_DOUBLE_EQ(36.0, HoursBetween(later, earlier));
    EXPECT_DOUBLE_EQ(1.5, DaysBetween(later, earlier));
    EXPECT_DOUBLE_EQ(-1.5, DaysBetween(earlier, later));
}

TEST(AccessOperationTest, StringConversion) {
    EXPECT_STREQ("view", ToString(AccessOperation::VIEW));
    EXPECT_STREQ("create", ToString(AccessOperation::CREATE));
    EXPECT_STREQ("update", ToString(AccessOperation::UPDATE));

    EXPECT_EQ(AccessOperation::CREATE, ParseAccessOperation("create"));
    EXPECT_EQ(AccessOperation::UPDATE, ParseAccessOperation("UPDATE"));
    EXPECT_FALSE(ParseAccessOperation("delete").has_value());
}

TEST(TokenEstimateTest, RoundsUp) {
    EXPECT_EQ(0u, EstimateTokens(""));
    EXPECT_EQ(1u, EstimateTokens("a"));
    EXPECT_EQ(1u, EstimateTokens("abcd"));
    EXPECT_EQ(2u, EstimateTokens("abcde"));
    EXPECT_EQ(250u, EstimateTokens(std::string(1000, 'x')));
}

} // namespace
} // namespace ctxmem
