#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/pty.hpp>

class Backend;

enum class SessionStatus { INITIALIZING, READY, BUSY, ERROR, CLOSED };

const char* session_status_name(SessionStatus status);

struct SessionOptions {
    std::string id;                  // empty: generated UUID
    std::string name;                // empty: "session-<first 8 of id>"
    std::string shell;               // empty: backend default
    std::string cwd;                 // empty: backend default
    EnvMap env;
    int cols = DEFAULT_PTY_COLS;
    int rows = DEFAULT_PTY_ROWS;
};

struct CommandContext {
    std::string session_id = DEFAULT_SESSION_ID;
    std::string command;
    int timeout_ms = 0;              // 0: store default
};

struct CommandResult {
    std::string session_id;
    std::string command;
    std::string output;
    std::optional<int> exit_code;    // unset on timeout
    bool success = false;
    long long duration_ms = 0;
    bool timed_out = false;
    std::string error;
};

struct SessionInfo {
    std::string id;
    std::string name;
    SessionStatus status;
    std::string last_command;
    std::string cwd;
    std::string error;
    TimePoint created_at;
    TimePoint last_activity_at;
};

// One long-lived shell. Everything below `mutex` is guarded by it; the
// PTY is written to without it held.
struct TerminalSession {
    TerminalSession(std::string id, std::string name,
                    std::shared_ptr<Backend> backend,
                    std::string cwd, EnvMap env,
                    std::size_t max_buffer_size);

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    const std::string id;
    const std::string name;
    const std::shared_ptr<Backend> backend;
    const std::string cwd;
    const EnvMap env;
    const std::size_t max_buffer_size;
    const TimePoint created_at;

    mutable std::mutex mutex;
    std::condition_variable output_cv;   // notified on every appended chunk and on close
    std::string output_buffer;
    SessionStatus status = SessionStatus::INITIALIZING;
    std::string last_command;
    std::string error;
    TimePoint last_activity_at;

    // Declared last so it is destroyed first: the reader thread is joined
    // before the buffer and mutex it writes to go away.
    std::unique_ptr<PtyHandle> pty;

    // Append PTY output, dropping the oldest bytes beyond max_buffer_size.
    void append_output(const std::string& data);

    SessionStatus get_status() const;
    std::string buffer_snapshot() const;
    SessionInfo info() const;
};
