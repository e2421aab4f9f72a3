#include <gtest/gtest.h>
#include "fake_shell.hpp"
#include <core/time_utils.hpp>
#include <polling/log_tailer.hpp>

static const char* kLogPath = "/var/log/app.log";

class LogTailerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend->files().write(kLogPath,
            "2024-01-15T10:00:00Z service started\n"
            "[WARN] disk at 91%\n"
            "[ERROR] request failed\n");
        ASSERT_TRUE(manager.get_or_create_session().is_ok());
    }

    TailOptions options(int lines, bool follow = true) {
        TailOptions o;
        o.lines = lines;
        o.follow = follow;
        o.timeout_ms = 3000;
        return o;
    }

    std::shared_ptr<fake::FakeBackend> backend = std::make_shared<fake::FakeBackend>();
    SessionManager manager{backend, fake::fast_config()};
    LogTailer tailer{manager};
};

TEST_F(LogTailerTest, StartReturnsLastLines) {
    auto r = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(2));
    ASSERT_TRUE(r.is_ok()) << r.error;

    const auto& entries = r.value.entries;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].content, "disk at 91%");
    EXPECT_EQ(entries[0].level, LogLevel::WARN);
    EXPECT_EQ(entries[1].content, "request failed");
    EXPECT_EQ(entries[1].level, LogLevel::ERROR);

    auto state = tailer.get_tail(r.value.tail_id);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, PollingStatus::RUNNING);
    EXPECT_EQ(state->read_position, 79);
    EXPECT_EQ(state->read_timeout_ms, 3000);
}

TEST_F(LogTailerTest, IncrementalReadsOnlyAppendedLines) {
    auto id = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(0)).value.tail_id;

    backend->files().append(kLogPath,
        "[INFO] user login\n"
        "2024-01-15T10:05:00Z fatal: out of memory\n");

    auto r = tailer.get_incremental_logs(id);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].content, "user login");
    EXPECT_EQ(r.value[0].level, LogLevel::INFO);
    EXPECT_EQ(r.value[1].content, "fatal: out of memory");
    EXPECT_EQ(r.value[1].level, LogLevel::ERROR);
    EXPECT_EQ(r.value[1].timestamp, *parse_iso8601("2024-01-15T10:05:00Z"));

    auto again = tailer.get_incremental_logs(id);
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value.empty());
}

TEST_F(LogTailerTest, GetLogsFiltersBySince) {
    auto id = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(0)).value.tail_id;

    auto all = tailer.get_logs(id);
    ASSERT_TRUE(all.is_ok()) << all.error;
    ASSERT_EQ(all.value.size(), 3u);
    EXPECT_EQ(all.value[0].content, "service started");

    // Tagged lines carry no timestamp of their own and count as just received.
    auto recent = tailer.get_logs(id, parse_iso8601("2024-01-15T10:01:00Z"));
    ASSERT_TRUE(recent.is_ok());
    ASSERT_EQ(recent.value.size(), 2u);
    EXPECT_EQ(recent.value[0].content, "disk at 91%");
}

TEST_F(LogTailerTest, QuotesAwkwardPaths) {
    const std::string path = "/tmp/my app's.log";
    backend->files().write(path, "[INFO] spaced out\n");

    auto r = tailer.start_tailing(DEFAULT_SESSION_ID, path, options(5));
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.entries.size(), 1u);
    EXPECT_EQ(r.value.entries[0].content, "spaced out");
    EXPECT_EQ(tailer.get_tail(r.value.tail_id)->status, PollingStatus::RUNNING);
}

TEST_F(LogTailerTest, MissingFilePutsTailInError) {
    auto r = tailer.start_tailing(DEFAULT_SESSION_ID, "/nope.log", options(10));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.entries.empty());

    auto state = tailer.get_tail(r.value.tail_id);
    EXPECT_EQ(state->status, PollingStatus::ERROR);
    EXPECT_EQ(state->error, "Failed to read initial log lines");
    EXPECT_EQ(state->read_position, 0);

    auto logs = tailer.get_logs(r.value.tail_id);
    ASSERT_TRUE(logs.is_ok());
    EXPECT_TRUE(logs.value.empty());
}

TEST_F(LogTailerTest, NoFollowCompletesAfterSnapshot) {
    auto r = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(1, false));
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.entries.size(), 1u);
    EXPECT_EQ(tailer.get_tail(r.value.tail_id)->status, PollingStatus::COMPLETED);
    EXPECT_TRUE(tailer.get_active_tails().empty());
}

TEST_F(LogTailerTest, ReadTimeoutIsCapped) {
    TailOptions o;
    o.lines = 0;
    auto id = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, o).value.tail_id;
    EXPECT_EQ(tailer.get_tail(id)->read_timeout_ms, TAIL_READ_TIMEOUT_MS);
}

TEST_F(LogTailerTest, StopAndCleanup) {
    auto a = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(0)).value.tail_id;
    auto b = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(0)).value.tail_id;

    tailer.stop_tailing(a);
    tailer.stop_tailing("unknown");
    EXPECT_EQ(tailer.get_tail(a)->status, PollingStatus::STOPPED);

    auto active = tailer.get_active_tails();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].id, b);
    EXPECT_EQ(tailer.get_all_tails().size(), 2u);

    EXPECT_EQ(tailer.cleanup_stopped(), 1);
    EXPECT_FALSE(tailer.get_tail(a).has_value());
    EXPECT_EQ(tailer.get_logs(a).code, ErrorCode::TAIL_NOT_FOUND);
}

TEST_F(LogTailerTest, Preconditions) {
    EXPECT_EQ(tailer.start_tailing("missing", kLogPath).code, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(tailer.start_tailing(DEFAULT_SESSION_ID, "").code, ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(tailer.get_incremental_logs("nope").code, ErrorCode::TAIL_NOT_FOUND);
    EXPECT_TRUE(tailer.get_all_tails().empty());
}

TEST_F(LogTailerTest, ClosedSessionIsReported) {
    auto id = tailer.start_tailing(DEFAULT_SESSION_ID, kLogPath, options(0)).value.tail_id;
    manager.close_session(DEFAULT_SESSION_ID);

    EXPECT_EQ(tailer.get_logs(id).code, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(tailer.get_incremental_logs(id).code, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(manager.session_count(), 0u);
    EXPECT_EQ(backend->created(), 1);
}
