// CONCORD - Time Utilities Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/util/time.h>

using namespace concord::util;

TEST(TimeTest, UnixMillisConversions) {
    TimePoint tp = FromUnixMillis(1700000000123);
    EXPECT_EQ(ToUnixMillis(tp), 1700000000123);
    EXPECT_TRUE(IsZero(FromUnixMillis(0)));
    EXPECT_FALSE(IsZero(tp));
    EXPECT_TRUE(IsZero(TimePoint()));
}

TEST(TimeTest, FormatISO8601Millis) {
    EXPECT_EQ(FormatISO8601Millis(FromUnixMillis(1700000000123)), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(FormatISO8601Millis(FromUnixMillis(0)), "1970-01-01T00:00:00.000Z");
}

TEST(TimeTest, ParseISO8601) {
    TimePoint tp;
    ASSERT_TRUE(ParseISO8601("2023-11-14T22:13:20.123Z", &tp));
    EXPECT_EQ(ToUnixMillis(tp), 1700000000123);

    ASSERT_TRUE(ParseISO8601("2023-11-14T22:13:20Z", &tp));
    EXPECT_EQ(ToUnixMillis(tp), 1700000000000);

    // Fractions beyond milliseconds are truncated
    ASSERT_TRUE(ParseISO8601("2023-11-14T22:13:20.123456789Z", &tp));
    EXPECT_EQ(ToUnixMillis(tp), 1700000000123);

    ASSERT_TRUE(ParseISO8601("2023-11-14T23:13:20.5+01:00", &tp));
    EXPECT_EQ(ToUnixMillis(tp), 1700000000500);
}

TEST(TimeTest, ParseISO8601RejectsMalformed) {
    TimePoint tp = FromUnixMillis(42);
    EXPECT_FALSE(ParseISO8601("", &tp));
    EXPECT_FALSE(ParseISO8601("yesterday", &tp));
    EXPECT_FALSE(ParseISO8601("2023-11-14T22:13:20.Z", &tp));
    EXPECT_FALSE(ParseISO8601("2023-11-14T22:13:20Zjunk", &tp));
    EXPECT_EQ(ToUnixMillis(tp), 42);
}

TEST(TimeTest, FormatParseAgree) {
    TimePoint in = FromUnixMillis(1712345678901);
    TimePoint out;
    ASSERT_TRUE(ParseISO8601(FormatISO8601Millis(in), &out));
    EXPECT_EQ(in, out);
}

TEST(ClockTest, ManualClockAdvances) {
    ManualClock clock(FromUnixMillis(1000));
    EXPECT_EQ(ToUnixMillis(clock.Now()), 1000);
    clock.Advance(Seconds(125));
    EXPECT_EQ(ToUnixMillis(clock.Now()), 126000);
    clock.Set(FromUnixMillis(5));
    EXPECT_EQ(ToUnixMillis(clock.Now()), 5);
}

TEST(ClockTest, SystemClockIsRecent) {
    SystemClock clock;
    EXPECT_GT(ToUnixMillis(clock.Now()), 1700000000000);
}
