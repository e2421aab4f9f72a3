#include "log_tailer.hpp"
#include "log_parser.hpp"
#include <session/session_manager.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

LogTailer::LogTailer(SessionManager& sessions, TailConfig defaults)
    : sessions_(sessions), defaults_(defaults) {}

Result<TailStart> LogTailer::start_tailing(const std::string& session_id,
                                           const std::string& file_path) {
    TailOptions options;
    options.lines = defaults_.lines;
    options.timeout_ms = defaults_.timeout_ms;
    return start_tailing(session_id, file_path, options);
}

Result<TailStart> LogTailer::start_tailing(const std::string& session_id,
                                           const std::string& file_path,
                                           const TailOptions& options) {
    using R = Result<TailStart>;
    if (!sessions_.get_session(session_id)) {
        return R::Err(ErrorCode::SESSION_NOT_FOUND, errors::session_not_found(session_id));
    }
    if (file_path.empty()) {
        return R::Err(ErrorCode::INVALID_PARAMETER, "File path cannot be empty");
    }

    LogTailState state;
    state.id = generate_uuid();
    state.file_path = file_path;
    state.session_id = session_id;
    state.follow = options.follow;
    state.created_at = Clock::now();
    state.updated_at = state.created_at;

    // Reads never wait longer than the tail's own timeout.
    state.read_timeout_ms = options.timeout_ms > 0
        ? std::min(options.timeout_ms, TAIL_READ_TIMEOUT_MS) : TAIL_READ_TIMEOUT_MS;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tails_[state.id] = state;
    }
    termkeep_log(fmt::format("tail {}: start {} in session {}", state.id, file_path, session_id));

    TailStart start;
    start.tail_id = state.id;

    if (auto size = file_size(session_id, file_path)) {
        update(state.id, [&](LogTailState& t) { t.read_position = *size; });
    }

    if (options.lines > 0) {
        auto output = read(state.id, session_id,
                           fmt::format("tail -n {} {}", options.lines, shell_quote(file_path)),
                           state.read_timeout_ms, "Failed to read initial log lines");
        if (output) start.entries = parse_log_text(*output);
    }

    if (!options.follow) {
        update(state.id, [](LogTailState& t) {
            if (t.status == PollingStatus::RUNNING) t.status = PollingStatus::COMPLETED;
        });
    }
    return R::Ok(start);
}

Result<std::vector<LogEntry>> LogTailer::get_logs(const std::string& tail_id,
                                                  std::optional<TimePoint> since) {
    using R = Result<std::vector<LogEntry>>;
    auto tail = resolve(tail_id);
    if (tail.is_err()) return R::Err(tail.code, tail.error);

    auto output = read(tail_id, tail.value.session_id,
                       "cat " + shell_quote(tail.value.file_path),
                       tail.value.read_timeout_ms, "Failed to read log file");
    if (!output) return R::Ok({});

    update(tail_id, [](LogTailState& t) { t.updated_at = Clock::now(); });
    return R::Ok(parse_log_text(*output, since));
}

Result<std::vector<LogEntry>> LogTailer::get_incremental_logs(const std::string& tail_id) {
    using R = Result<std::vector<LogEntry>>;
    auto tail = resolve(tail_id);
    if (tail.is_err()) return R::Err(tail.code, tail.error);

    const auto& t = tail.value;
    auto output = read(tail_id, t.session_id,
                       fmt::format("tail -c +{} {}", t.read_position + 1, shell_quote(t.file_path)),
                       t.read_timeout_ms, "Failed to read log file");
    if (!output) return R::Ok({});

    auto size = file_size(t.session_id, t.file_path);
    update(tail_id, [&](LogTailState& s) {
        if (size) s.read_position = *size;
        s.updated_at = Clock::now();
    });
    return R::Ok(parse_log_text(*output));
}

void LogTailer::stop_tailing(const std::string& tail_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tails_.find(tail_id);
    if (it == tails_.end()) return;
    it->second.status = PollingStatus::STOPPED;
    it->second.updated_at = Clock::now();
    termkeep_log(fmt::format("tail {}: stopped", tail_id));
}

std::vector<LogTailState> LogTailer::get_active_tails() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LogTailState> out;
    for (const auto& [id, t] : tails_) {
        if (t.status == PollingStatus::RUNNING) out.push_back(t);
    }
    return out;
}

std::vector<LogTailState> LogTailer::get_all_tails() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LogTailState> out;
    for (const auto& [id, t] : tails_) out.push_back(t);
    return out;
}

std::optional<LogTailState> LogTailer::get_tail(const std::string& tail_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tails_.find(tail_id);
    if (it == tails_.end()) return std::nullopt;
    return it->second;
}

int LogTailer::cleanup_stopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    int cleaned = 0;
    for (auto it = tails_.begin(); it != tails_.end();) {
        if (is_terminal(it->second.status)) {
            it = tails_.erase(it);
            ++cleaned;
        } else {
            ++it;
        }
    }
    return cleaned;
}

// ── Helpers ─────────────────────────────────────────────────

Result<LogTailState> LogTailer::resolve(const std::string& tail_id) const {
    LogTailState state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tails_.find(tail_id);
        if (it == tails_.end()) {
            return Result<LogTailState>::Err(ErrorCode::TAIL_NOT_FOUND,
                                             errors::tail_not_found(tail_id));
        }
        state = it->second;
    }
    if (!sessions_.get_session(state.session_id)) {
        return Result<LogTailState>::Err(ErrorCode::SESSION_NOT_FOUND,
                                         errors::session_not_found(state.session_id));
    }
    return Result<LogTailState>::Ok(state);
}

std::optional<std::string> LogTailer::read(const std::string& tail_id,
                                           const std::string& session_id,
                                           const std::string& command,
                                           int timeout_ms,
                                           const char* failure) {
    CommandContext ctx;
    ctx.session_id = session_id;
    ctx.command = command;
    ctx.timeout_ms = timeout_ms;
    auto result = sessions_.execute_command(sessions_.get_session(session_id), ctx);

    std::string error;
    if (result.is_err()) {
        error = result.error;
    } else if (!result.value.success) {
        error = result.value.error.empty() ? failure : result.value.error;
    } else {
        return result.value.output;
    }

    update(tail_id, [&](LogTailState& t) {
        t.status = PollingStatus::ERROR;
        t.error = error;
        t.updated_at = Clock::now();
    });
    termkeep_log(fmt::format("tail {}: {}", tail_id, error));
    return std::nullopt;
}

std::optional<long long> LogTailer::file_size(const std::string& session_id,
                                              const std::string& file_path) {
    std::string quoted = shell_quote(file_path);
    CommandContext ctx;
    ctx.session_id = session_id;
    ctx.command = fmt::format("stat -c %s {} 2>/dev/null || wc -c < {}", quoted, quoted);
    ctx.timeout_ms = TAIL_STAT_TIMEOUT_MS;

    auto result = sessions_.execute_command(sessions_.get_session(session_id), ctx);
    if (result.is_err() || !result.value.success) return std::nullopt;

    long long size = safe_stoll(trimmed(result.value.output), -1);
    if (size < 0) return std::nullopt;
    return size;
}

void LogTailer::update(const std::string& tail_id,
                       const std::function<void(LogTailState&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tails_.find(tail_id);
    if (it != tails_.end()) fn(it->second);
}
