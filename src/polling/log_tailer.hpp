#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <session/session.hpp>
#include "types.hpp"

class SessionManager;

// tail -f over a session: every read is an ordinary command (stat, tail,
// cat) run through the session store, so a tail shares its session's
// one-command-at-a-time rule with everything else.
//
// The read cursor is the file size at the last read. Bytes appended
// between an incremental read and the size query that follows it are
// skipped.
class LogTailer {
public:
    explicit LogTailer(SessionManager& sessions, TailConfig defaults = {});

    LogTailer(const LogTailer&) = delete;
    LogTailer& operator=(const LogTailer&) = delete;

    Result<TailStart> start_tailing(const std::string& session_id,
                                    const std::string& file_path);
    Result<TailStart> start_tailing(const std::string& session_id,
                                    const std::string& file_path,
                                    const TailOptions& options);

    // Whole file, optionally only entries stamped at or after `since`.
    Result<std::vector<LogEntry>> get_logs(const std::string& tail_id,
                                           std::optional<TimePoint> since = std::nullopt);

    // Everything past the read cursor; advances the cursor.
    Result<std::vector<LogEntry>> get_incremental_logs(const std::string& tail_id);

    void stop_tailing(const std::string& tail_id);

    std::vector<LogTailState> get_active_tails() const;
    std::vector<LogTailState> get_all_tails() const;
    std::optional<LogTailState> get_tail(const std::string& tail_id) const;

    // Drop stopped, error and completed tails. Returns how many.
    int cleanup_stopped();

private:
    // Resolve a tail and check its session still exists.
    Result<LogTailState> resolve(const std::string& tail_id) const;

    // Run a read command; a failed or non-zero command puts the tail in error.
    std::optional<std::string> read(const std::string& tail_id,
                                    const std::string& session_id,
                                    const std::string& command,
                                    int timeout_ms,
                                    const char* failure);

    std::optional<long long> file_size(const std::string& session_id,
                                       const std::string& file_path);

    void update(const std::string& tail_id,
                const std::function<void(LogTailState&)>& fn);

    SessionManager& sessions_;
    TailConfig defaults_;

    mutable std::mutex mutex_;
    std::map<std::string, LogTailState> tails_;
};
