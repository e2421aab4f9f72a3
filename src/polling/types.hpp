#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

// Shared by background processes and log tails.
enum class PollingStatus { RUNNING, PAUSED, COMPLETED, ERROR, STOPPED };

const char* polling_status_name(PollingStatus status);

// completed, error and stopped never transition again.
inline bool is_terminal(PollingStatus status) {
    return status == PollingStatus::COMPLETED ||
           status == PollingStatus::ERROR ||
           status == PollingStatus::STOPPED;
}

// ── Background processes ────────────────────────────────────

struct BackgroundProcess {
    std::string id;
    std::string session_id;
    std::string command;
    PollingStatus status = PollingStatus::RUNNING;
    std::string output_buffer;
    size_t read_position = 0;
    std::optional<int> exit_code;
    std::string error;
    TimePoint created_at;
    TimePoint updated_at;
    int interval_ms = DEFAULT_POLL_INTERVAL_MS;
    size_t max_buffer_size = DEFAULT_PROCESS_BUFFER;
};

struct PollResult {
    std::string process_id;
    std::string session_id;
    std::string output;
    bool has_new_content = false;
    bool is_complete = false;        // completed or error
    PollingStatus status = PollingStatus::RUNNING;
    std::optional<int> exit_code;
    std::string error;
    TimePoint timestamp;
};

struct ProcessInfo {
    std::string id;
    std::string session_id;
    std::string command;
    PollingStatus status;
    TimePoint created_at;
    TimePoint updated_at;
    size_t output_length;
};

// ── Log tailing ─────────────────────────────────────────────

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

const char* log_level_name(LogLevel level);

struct LogEntry {
    TimePoint timestamp;
    std::string content;
    LogLevel level = LogLevel::INFO;
};

struct TailOptions {
    int lines = DEFAULT_TAIL_LINES;
    bool follow = true;
    int timeout_ms = DEFAULT_TAIL_TIMEOUT_MS;
};

struct LogTailState {
    std::string id;
    std::string file_path;
    std::string session_id;
    PollingStatus status = PollingStatus::RUNNING;
    long long read_position = 0;     // byte offset in the file
    bool follow = true;
    int read_timeout_ms = TAIL_READ_TIMEOUT_MS;
    std::string error;
    TimePoint created_at;
    TimePoint updated_at;
};

struct TailStart {
    std::string tail_id;
    std::vector<LogEntry> entries;   // initial snapshot, empty when lines == 0
};
