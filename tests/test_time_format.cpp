//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_time_format.cpp
// Purpose: GoogleTests for RFC3339 UTC parsing and millisecond formatting
//==========================================================================================================

#include <gtest/gtest.h>

#include "sysmon/TimeFormat.h"

using namespace sysmon;

TEST(TimeFormat, ParsesWholeSeconds) {
    auto t = ParseUtcTimestamp("1970-01-01T00:00:01Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, kMicrosPerSecond);

    auto y2k = ParseUtcTimestamp("2000-01-01T00:00:00Z");
    ASSERT_TRUE(y2k.has_value());
    EXPECT_EQ(*y2k, 946684800LL * kMicrosPerSecond);
}

TEST(TimeFormat, ParsesFractionsUpToNanoseconds) {
    EXPECT_EQ(ParseUtcTimestamp("1970-01-01T00:00:00.5Z").value(), 500000);
    EXPECT_EQ(ParseUtcTimestamp("1970-01-01T00:00:00.123456Z").value(), 123456);
    EXPECT_EQ(ParseUtcTimestamp("1970-01-01T00:00:00.123456789Z").value(), 123456);
    EXPECT_FALSE(ParseUtcTimestamp("1970-01-01T00:00:00.1234567890Z").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("1970-01-01T00:00:00.Z").has_value());
}

TEST(TimeFormat, RejectsOffsetsAndMalformedText) {
    EXPECT_FALSE(ParseUtcTimestamp("2025-01-01T00:00:00+00:00").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("2025-01-01T00:00:00").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("2025-01-01 00:00:00Z").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("2025-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("2025-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("2025-01-01T24:00:00Z").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("yesterday").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("").has_value());
}

TEST(TimeFormat, AcceptsLeapDay) {
    EXPECT_TRUE(ParseUtcTimestamp("2024-02-29T12:00:00Z").has_value());
    EXPECT_FALSE(ParseUtcTimestamp("2023-02-29T12:00:00Z").has_value());
}

TEST(TimeFormat, FormatsWithMillisecondsAndZ) {
    EXPECT_EQ(FormatUtcMillis(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(FormatUtcMillis(1234567), "1970-01-01T00:00:01.234Z");
    const auto t = ParseUtcTimestamp("2025-06-18T10:20:30.456Z").value();
    EXPECT_EQ(FormatUtcMillis(t), "2025-06-18T10:20:30.456Z");
}

TEST(TimeFormat, FormatsPreEpochValues) {
    EXPECT_EQ(FormatUtcMillis(-1000), "1969-12-31T23:59:59.999Z");
}

TEST(TimeFormat, NowIsAfter2020) {
    EXPECT_GT(NowMicros(), ParseUtcTimestamp("2020-01-01T00:00:00Z").value());
}
