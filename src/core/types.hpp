#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <chrono>
#include <cstdint>
#include "errors.hpp"
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::NONE;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::NONE};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorCode::INTERNAL_ERROR};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::NONE;

    static Result<void> Ok() {
        return {true, "", ErrorCode::NONE};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorCode::INTERNAL_ERROR};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using EnvMap = std::map<std::string, std::string>;

// One-shot command result reported by a backend
struct ExecResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    long long duration_ms = 0;

    bool success() const { return exit_code == 0 && !timed_out; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Status callback for long operations (container start, SSH handshake)
using StatusCallback = std::function<void(const std::string&)>;

// ── Configuration sections ──────────────────────────────────

struct BackendSettings {
    std::string type = "auto";       // local | docker | ssh | auto
    std::string shell;               // empty: backend default
    std::string cwd;                 // empty: backend default
};

struct DockerConfig {
    std::string image = DEFAULT_DOCKER_IMAGE;
    std::string container;           // reuse this container when set
    std::string container_prefix = DEFAULT_CONTAINER_PREFIX;
    std::string shell = "/bin/bash";
    std::vector<std::string> mounts;  // "host:container"
    bool privileged = false;
};

struct SSHConfig {
    std::string host;
    std::string user;
    std::string password;
    std::string ssh_key_path;
    int port = SSH_DEFAULT_PORT;
    int timeout = 30;                // seconds
};

struct SessionConfig {
    int max_sessions = DEFAULT_MAX_SESSIONS;
    int default_timeout_ms = DEFAULT_COMMAND_TIMEOUT_MS;
    long long session_expiry_ms = DEFAULT_SESSION_EXPIRY_MS;
    std::size_t max_buffer_size = DEFAULT_SESSION_BUFFER;

    int create_settle_ms = SESSION_CREATE_SETTLE_MS;
    int command_settle_ms = COMMAND_SETTLE_MS;
    int write_pacing_ms = MARKER_WRITE_PACING_MS;
    int completion_settle_ms = COMPLETION_SETTLE_MS;
};

struct PollingConfig {
    int interval_ms = DEFAULT_POLL_INTERVAL_MS;
    int timeout_ms = DEFAULT_BACKGROUND_TIMEOUT_MS;
    std::size_t max_buffer_size = DEFAULT_PROCESS_BUFFER;
};

struct TailConfig {
    int lines = DEFAULT_TAIL_LINES;
    int timeout_ms = DEFAULT_TAIL_TIMEOUT_MS;
};
