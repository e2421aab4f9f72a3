#include "session_manager.hpp"
#include "marker_protocol.hpp"
#include <backends/backend.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

SessionManager::SessionManager(std::shared_ptr<Backend> backend, SessionConfig config)
    : backend_(std::move(backend)), config_(config) {}

SessionManager::~SessionManager() {
    close_all_sessions();
    reap_retired();
}

// ── Lifecycle ───────────────────────────────────────────────

Result<std::shared_ptr<TerminalSession>> SessionManager::create_session(
        const SessionOptions& options) {
    using R = Result<std::shared_ptr<TerminalSession>>;
    reap_retired();

    std::string id = options.id.empty() ? generate_uuid() : options.id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.size() + pending_ids_.size() >=
                static_cast<size_t>(config_.max_sessions)) {
            return R::Err(ErrorCode::MAX_SESSIONS_REACHED,
                          errors::max_sessions_reached(config_.max_sessions));
        }
        if (sessions_.count(id) || pending_ids_.count(id)) {
            return R::Err(ErrorCode::SESSION_ALREADY_EXISTS,
                          errors::session_already_exists(id));
        }
        pending_ids_.insert(id);
    }

    std::string name = options.name.empty() ? "session-" + id.substr(0, 8) : options.name;
    std::string cwd = options.cwd.empty() ? backend_->default_cwd() : options.cwd;

    PtyOptions pty_opts;
    pty_opts.shell = options.shell.empty() ? backend_->default_shell() : options.shell;
    pty_opts.cwd = cwd;
    pty_opts.env = options.env;
    pty_opts.cols = options.cols > 0 ? options.cols : DEFAULT_PTY_COLS;
    pty_opts.rows = options.rows > 0 ? options.rows : DEFAULT_PTY_ROWS;

    auto pty = backend_->create_pty(pty_opts);
    if (pty.is_err()) {
        release_reservation(id);
        termkeep_log(fmt::format("session {}: create failed: {}", id, pty.error));
        return R::Err(ErrorCode::SESSION_CREATE_FAILED,
                      errors::session_create_failed(pty.error));
    }

    auto session = std::make_shared<TerminalSession>(
        id, name, backend_, cwd, options.env, config_.max_buffer_size);
    session->pty = std::move(pty.value);

    // The PTY dies before the session's other members, so a raw pointer is
    // safe for the reader thread.
    TerminalSession* raw = session.get();
    session->pty->on_data([raw](const std::string& data) {
        raw->append_output(data);
    });
    std::weak_ptr<TerminalSession> weak = session;
    session->pty->on_exit([this, weak](int exit_code) {
        if (auto s = weak.lock()) handle_exit(s, exit_code);
    });

    platform::sleep_ms(config_.create_settle_ms);

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->status != SessionStatus::CLOSED) {
            session->status = SessionStatus::READY;
        }
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        pending_ids_.erase(id);
        sessions_[id] = session;
    }
    pending_cv_.notify_all();

    // An exit that raced the insert above found nothing to remove.
    std::string exit_error;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->status == SessionStatus::CLOSED) exit_error = session->error;
    }
    if (!exit_error.empty()) {
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(id);
            if (it != sessions_.end() && it->second == session) sessions_.erase(it);
        }
        termkeep_log(fmt::format("session {}: shell exited during startup: {}", id, exit_error));
        return R::Err(ErrorCode::SESSION_CREATE_FAILED,
                      errors::session_create_failed(exit_error));
    }

    termkeep_log(fmt::format("session {} ({}) created: shell={} cwd={}",
                             id, name, pty_opts.shell, cwd));
    return R::Ok(session);
}

std::shared_ptr<TerminalSession> SessionManager::get_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

Result<std::shared_ptr<TerminalSession>> SessionManager::get_or_create_session(
        const std::string& id, const SessionOptions& options) {
    using R = Result<std::shared_ptr<TerminalSession>>;
    std::string sid = id.empty() ? DEFAULT_SESSION_ID : id;

    {
        // Another caller may be creating this id right now; wait for it.
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        pending_cv_.wait(lock, [&] { return pending_ids_.count(sid) == 0; });
        auto it = sessions_.find(sid);
        if (it != sessions_.end()) return R::Ok(it->second);
    }

    SessionOptions opts = options;
    opts.id = sid;
    auto created = create_session(opts);
    if (created.is_err() && created.code == ErrorCode::SESSION_ALREADY_EXISTS) {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        pending_cv_.wait(lock, [&] { return pending_ids_.count(sid) == 0; });
        auto it = sessions_.find(sid);
        if (it != sessions_.end()) return R::Ok(it->second);
    }
    return created;
}

std::vector<SessionInfo> SessionManager::list_sessions() const {
    std::vector<std::shared_ptr<TerminalSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, s] : sessions_) sessions.push_back(s);
    }

    std::vector<SessionInfo> out;
    out.reserve(sessions.size());
    for (const auto& s : sessions) out.push_back(s->info());
    std::sort(out.begin(), out.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.created_at < b.created_at;
    });
    return out;
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void SessionManager::close_session(const std::string& id) {
    reap_retired();

    std::shared_ptr<TerminalSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }
    shutdown_session(session);
    termkeep_log(fmt::format("session {} closed", id));
}

void SessionManager::close_all_sessions() {
    std::map<std::string, std::shared_ptr<TerminalSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (const auto& [id, s] : sessions) {
        shutdown_session(s);
        termkeep_log(fmt::format("session {} closed", id));
    }
}

int SessionManager::close_expired_sessions() {
    auto now = Clock::now();
    auto expiry = std::chrono::milliseconds(config_.session_expiry_ms);

    std::vector<std::string> expired;
    for (const auto& info : list_sessions()) {
        if (info.status == SessionStatus::BUSY) continue;
        if (now - info.last_activity_at > expiry) expired.push_back(info.id);
    }
    for (const auto& id : expired) {
        termkeep_log(fmt::format("session {} expired", id));
        close_session(id);
    }
    return static_cast<int>(expired.size());
}

void SessionManager::shutdown_session(const std::shared_ptr<TerminalSession>& session) {
    // Detach first: a deliberate kill is not an unexpected exit.
    session->pty->on_exit(nullptr);
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->status = SessionStatus::CLOSED;
    }
    session->output_cv.notify_all();

    try {
        session->pty->kill();
    } catch (const std::exception& e) {
        termkeep_log(fmt::format("session {}: kill failed: {}", session->id, e.what()));
    }
}

void SessionManager::handle_exit(const std::shared_ptr<TerminalSession>& session,
                                 int exit_code) {
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->status == SessionStatus::CLOSED) return;
        session->status = SessionStatus::CLOSED;
        session->error = fmt::format("Process exited with code {}", exit_code);
    }
    session->output_cv.notify_all();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session->id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
            retired_.push_back(session);
        }
    }
    termkeep_log(fmt::format("session {}: process exited with code {}",
                             session->id, exit_code));
}

void SessionManager::release_reservation(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        pending_ids_.erase(id);
    }
    pending_cv_.notify_all();
}

void SessionManager::reap_retired() {
    std::vector<std::shared_ptr<TerminalSession>> retired;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        retired.swap(retired_);
    }
    // Destroyed here, outside the lock, joining their reader threads.
}

// ── Command protocol ────────────────────────────────────────

Result<CommandResult> SessionManager::execute_command(const CommandContext& ctx) {
    using R = Result<CommandResult>;
    reap_retired();

    if (trimmed(ctx.command).empty()) {
        return R::Err(ErrorCode::COMMAND_EMPTY, errors::command_empty());
    }

    auto got = get_or_create_session(ctx.session_id);
    if (got.is_err()) return R::Err(got.code, got.error);
    return execute_command(got.value, ctx);
}

Result<CommandResult> SessionManager::execute_command(
    const std::shared_ptr<TerminalSession>& session, const CommandContext& ctx) {
    using R = Result<CommandResult>;
    if (!session) {
        return R::Err(ErrorCode::SESSION_NOT_FOUND, errors::session_not_found(ctx.session_id));
    }
    if (trimmed(ctx.command).empty()) {
        return R::Err(ErrorCode::COMMAND_EMPTY, errors::command_empty());
    }

    int timeout_ms = ctx.timeout_ms > 0 ? ctx.timeout_ms : config_.default_timeout_ms;
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + std::chrono::milliseconds(timeout_ms);

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->status == SessionStatus::BUSY) {
            return R::Err(ErrorCode::SESSION_BUSY, errors::session_busy(session->id));
        }
        if (session->status == SessionStatus::CLOSED) {
            return R::Err(ErrorCode::SESSION_CLOSED, errors::session_closed(session->id));
        }
        session->status = SessionStatus::BUSY;
        session->last_command = ctx.command;
        session->last_activity_at = Clock::now();
        session->output_buffer.clear();
    }

    auto elapsed_ms = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    };

    // Back to ready unless the shell went away meanwhile.
    auto release = [&] {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->status == SessionStatus::BUSY) {
            session->status = SessionStatus::READY;
        }
        session->last_activity_at = Clock::now();
    };

    termkeep_log(fmt::format("session {}: exec: {}", session->id, ctx.command));

    platform::sleep_ms(config_.command_settle_ms);

    MarkerSet markers = make_markers(epoch_ms());
    auto writes = build_marker_writes(markers, ctx.command);
    for (size_t i = 0; i < writes.size(); ++i) {
        if (!session->pty->write(writes[i])) {
            termkeep_log(fmt::format("session {}: write failed", session->id));
            break;
        }
        if (i + 1 < writes.size()) platform::sleep_ms(config_.write_pacing_ms);
    }

    bool finished;
    bool closed;
    {
        std::unique_lock<std::mutex> lock(session->mutex);
        finished = session->output_cv.wait_until(lock, deadline, [&] {
            return marker_printed(session->output_buffer, markers.end) ||
                   session->status == SessionStatus::CLOSED;
        });
        closed = session->status == SessionStatus::CLOSED;
    }

    if (closed) {
        termkeep_log(fmt::format("session {}: closed during command", session->id));
        return R::Err(ErrorCode::SESSION_CLOSED, errors::session_closed(session->id));
    }

    CommandResult result;
    result.session_id = session->id;
    result.command = ctx.command;

    if (!finished) {
        release();
        result.timed_out = true;
        result.success = false;
        result.duration_ms = elapsed_ms();
        result.error = errors::command_timeout(timeout_ms);
        termkeep_log(fmt::format("session {}: timeout after {}ms: {}",
                                 session->id, timeout_ms, ctx.command));
        return R::Ok(result);
    }

    platform::sleep_ms(config_.completion_settle_ms);

    std::string raw = session->buffer_snapshot();
    release();

    auto parsed = parse_marker_output(raw, markers, ctx.command);
    result.output = parsed.output;
    result.exit_code = parsed.exit_code;
    result.success = parsed.exit_code.value_or(0) == 0;
    result.duration_ms = elapsed_ms();

    termkeep_log(fmt::format("session {}: done exit={} in {}ms",
                             session->id, parsed.exit_code.value_or(0),
                             result.duration_ms));
    return R::Ok(result);
}
