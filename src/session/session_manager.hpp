#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "session.hpp"

class Backend;

// Owns every live session and runs commands inside them.
//
// Sessions are keyed by id. A session whose shell exits on its own is
// removed on the PTY reader thread and parked in a retired list, then
// released from the next caller thread that enters the store (a reader
// thread cannot join itself).
class SessionManager {
public:
    explicit SessionManager(std::shared_ptr<Backend> backend, SessionConfig config = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Spawn a shell and wait for it to settle. Fails on capacity, id
    // collision, or a backend that cannot allocate a PTY.
    Result<std::shared_ptr<TerminalSession>> create_session(const SessionOptions& options = {});

    // nullptr when unknown.
    std::shared_ptr<TerminalSession> get_session(const std::string& id) const;

    // Existing session, or a new one under that id.
    Result<std::shared_ptr<TerminalSession>> get_or_create_session(
        const std::string& id = DEFAULT_SESSION_ID,
        const SessionOptions& options = {});

    std::vector<SessionInfo> list_sessions() const;
    size_t session_count() const;

    // Kill the shell and forget the session. Unknown id is a no-op.
    void close_session(const std::string& id);
    void close_all_sessions();

    // Close sessions that are not busy and have been idle longer than
    // session_expiry_ms. Returns how many were closed.
    int close_expired_sessions();

    // Run one command to completion (or timeout) in the context's session,
    // creating that session on demand.
    Result<CommandResult> execute_command(const CommandContext& ctx);

    // Run in a session the caller already resolved. Never creates one; a
    // session closed since it was resolved fails with SESSION_CLOSED.
    Result<CommandResult> execute_command(const std::shared_ptr<TerminalSession>& session,
                                          const CommandContext& ctx);

    const SessionConfig& config() const { return config_; }
    std::shared_ptr<Backend> backend() const { return backend_; }

private:
    void handle_exit(const std::shared_ptr<TerminalSession>& session, int exit_code);
    void shutdown_session(const std::shared_ptr<TerminalSession>& session);
    void release_reservation(const std::string& id);
    void reap_retired();

    std::shared_ptr<Backend> backend_;
    SessionConfig config_;

    mutable std::mutex sessions_mutex_;
    std::condition_variable pending_cv_;
    std::map<std::string, std::shared_ptr<TerminalSession>> sessions_;
    std::set<std::string> pending_ids_;      // being created; count toward capacity
    std::vector<std::shared_ptr<TerminalSession>> retired_;
};
