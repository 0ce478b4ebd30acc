// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include <gtest/gtest.h>

#include "core/TelemetryParser.hpp"

using namespace Lanwatch::Core;

TEST(TelemetryParserTest, ParsesAFullRecord) {
    TelemetryParser parser(2);
    auto parsed = parser.parse(
        R"({"timestampUtc":"2026-03-01T10:00:00Z","totalBytesPerSecond":1048576.5,"windowSeconds":3,)"
        R"("entriesInWindow":12,"hasActiveDownloads":true,)"
        R"("gameSpeeds":[{"gameAppId":440,"bytesPerSecond":1048576}],"clientSpeeds":[]})");

    ASSERT_EQ(parsed.status, LineStatus::SNAPSHOT);
    EXPECT_EQ(parsed.snapshot.timestamp_utc, "2026-03-01T10:00:00Z");
    EXPECT_DOUBLE_EQ(parsed.snapshot.total_bytes_per_second, 1048576.5);
    EXPECT_EQ(parsed.snapshot.window_seconds, 3);
    EXPECT_EQ(parsed.snapshot.entries_in_window, 12);
    EXPECT_TRUE(parsed.snapshot.has_active_downloads);
    EXPECT_EQ(parsed.snapshot.breakdown["gameSpeeds"].size(), 1u);
}

TEST(TelemetryParserTest, FieldNamesAreCaseInsensitive) {
    TelemetryParser parser;
    auto parsed = parser.parse(R"({"TotalBytesPerSecond":10,"HASACTIVEDOWNLOADS":false,"windowseconds":5})");

    ASSERT_EQ(parsed.status, LineStatus::SNAPSHOT);
    EXPECT_DOUBLE_EQ(parsed.snapshot.total_bytes_per_second, 10.0);
    EXPECT_FALSE(parsed.snapshot.has_active_downloads);
    EXPECT_EQ(parsed.snapshot.window_seconds, 5);
}

TEST(TelemetryParserTest, MissingWindowTakesTheConfiguredDefault) {
    TelemetryParser parser(7);
    auto parsed = parser.parse(R"({"totalBytesPerSecond":0})");

    ASSERT_EQ(parsed.status, LineStatus::SNAPSHOT);
    EXPECT_EQ(parsed.snapshot.window_seconds, 7);
}

TEST(TelemetryParserTest, ActivityFlagFallsBackToEntryCount) {
    TelemetryParser parser;
    EXPECT_TRUE(parser.parse(R"({"entriesInWindow":4})").snapshot.has_active_downloads);
    EXPECT_FALSE(parser.parse(R"({"entriesInWindow":0})").snapshot.has_active_downloads);
}

TEST(TelemetryParserTest, NullFieldsCountAsAbsent) {
    TelemetryParser parser(2);
    auto parsed = parser.parse(R"({"windowSeconds":null,"totalBytesPerSecond":null,"gameSpeeds":null})");

    ASSERT_EQ(parsed.status, LineStatus::SNAPSHOT);
    EXPECT_EQ(parsed.snapshot.window_seconds, 2);
    EXPECT_FALSE(parsed.snapshot.breakdown.isMember("gameSpeeds"));
}

TEST(TelemetryParserTest, BlankLinesAreIgnored) {
    TelemetryParser parser;
    EXPECT_EQ(parser.parse("").status, LineStatus::BLANK);
    EXPECT_EQ(parser.parse("   \t").status, LineStatus::BLANK);
}

TEST(TelemetryParserTest, NoiseIsMalformed) {
    TelemetryParser parser;
    EXPECT_EQ(parser.parse("speed_tracker: watching /logs/access.log").status, LineStatus::MALFORMED);
    EXPECT_EQ(parser.parse(R"({"totalBytesPerSecond":1)").status, LineStatus::MALFORMED);
    EXPECT_EQ(parser.parse(R"([1,2,3])").status, LineStatus::MALFORMED);
    EXPECT_EQ(parser.parse(R"({"totalBytesPerSecond":1} trailing)").status, LineStatus::MALFORMED);
}

TEST(TelemetryParserTest, WrongFieldTypesAreMalformed) {
    TelemetryParser parser;
    auto parsed = parser.parse(R"({"totalBytesPerSecond":"fast"})");
    EXPECT_EQ(parsed.status, LineStatus::MALFORMED);
    EXPECT_FALSE(parsed.error.empty());

    EXPECT_EQ(parser.parse(R"({"hasActiveDownloads":"yes"})").status, LineStatus::MALFORMED);
    EXPECT_EQ(parser.parse(R"({"clientSpeeds":{}})").status, LineStatus::MALFORMED);
}

TEST(TelemetryParserTest, OutOfRangeWindowIsMalformedNotFatal) {
    TelemetryParser parser;
    EXPECT_EQ(parser.parse(R"({"windowSeconds":1e300})").status, LineStatus::MALFORMED);
}
