#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <polling/log_parser.hpp>

static const TimePoint kReceived = Clock::from_time_t(1700000000);

TEST(LogParser, IsoTimestampLine) {
    auto e = parse_log_line("2024-01-15T10:30:00.250Z worker crashed: error 5", kReceived);
    EXPECT_EQ(e.timestamp, *parse_iso8601("2024-01-15T10:30:00.250Z"));
    EXPECT_EQ(e.content, "worker crashed: error 5");
    EXPECT_EQ(e.level, LogLevel::ERROR);
}

TEST(LogParser, IsoWithOffsetAndSpaceSeparator) {
    auto e = parse_log_line("2024-01-15 12:30:00+02:00 warming cache", kReceived);
    EXPECT_EQ(e.timestamp, *parse_iso8601("2024-01-15T10:30:00Z"));
    EXPECT_EQ(e.content, "warming cache");
    EXPECT_EQ(e.level, LogLevel::INFO);
}

TEST(LogParser, TaggedLineUsesTag) {
    auto e = parse_log_line("[DEBUG] retry with error budget", kReceived);
    EXPECT_EQ(e.timestamp, kReceived);
    EXPECT_EQ(e.content, "retry with error budget");
    EXPECT_EQ(e.level, LogLevel::DEBUG);
}

TEST(LogParser, UnknownTagFallsBackToKeywords) {
    auto e = parse_log_line("[worker] connection warning", kReceived);
    EXPECT_EQ(e.content, "connection warning");
    EXPECT_EQ(e.level, LogLevel::WARN);
}

TEST(LogParser, PlainLineKeepsEverything) {
    auto e = parse_log_line("listening on :8080\r\n", kReceived);
    EXPECT_EQ(e.timestamp, kReceived);
    EXPECT_EQ(e.content, "listening on :8080");
    EXPECT_EQ(e.level, LogLevel::INFO);
}

TEST(LogParser, KeywordDetection) {
    EXPECT_EQ(detect_log_level("FATAL: disk gone"), LogLevel::ERROR);
    EXPECT_EQ(detect_log_level("stderr redirected"), LogLevel::ERROR);  // "err"
    EXPECT_EQ(detect_log_level("Warning: slow query"), LogLevel::WARN);
    EXPECT_EQ(detect_log_level("trace id=4"), LogLevel::DEBUG);
    EXPECT_EQ(detect_log_level("ready"), LogLevel::INFO);
}

TEST(LogParser, TagNames) {
    EXPECT_EQ(level_from_tag("warning"), LogLevel::WARN);
    EXPECT_EQ(level_from_tag("CRITICAL"), LogLevel::ERROR);
    EXPECT_EQ(level_from_tag("Trace"), LogLevel::DEBUG);
    EXPECT_FALSE(level_from_tag("http").has_value());
}

TEST(LogParser, TextSkipsBlankLinesAndFilters) {
    std::string text =
        "2024-01-15T10:00:00Z boot\n"
        "\n"
        "   \n"
        "2024-01-15T11:00:00Z ready\n"
        "[INFO] tagged\n";

    auto all = parse_log_text(text, std::nullopt, kReceived);
    ASSERT_EQ(all.size(), 3u);

    // The tagged line is stamped with the receive time.
    auto received = *parse_iso8601("2024-01-16T00:00:00Z");
    auto since = parse_log_text(text, parse_iso8601("2024-01-15T10:30:00Z"), received);
    ASSERT_EQ(since.size(), 2u);
    EXPECT_EQ(since[0].content, "ready");
    EXPECT_EQ(since[1].content, "tagged");
}
