#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <platform/pty.hpp>
#include "types.hpp"

class SessionManager;
struct TerminalSession;

// Runs commands in the background and lets the caller pick up their
// output piecemeal.
//
// Each process runs its command through the session store on a worker
// thread while a listener on the session's PTY copies every byte into the
// process buffer. Records stay until cleanup_completed(). A worker that
// has returned is joined by the next start_process() or cleanup_completed().
//
// The destructor joins the workers; close the sessions first so a
// long-running command does not hold it up until its timeout.
class OutputPoller {
public:
    explicit OutputPoller(SessionManager& sessions, PollingConfig defaults = {});
    ~OutputPoller();

    OutputPoller(const OutputPoller&) = delete;
    OutputPoller& operator=(const OutputPoller&) = delete;

    // Returns the new process id immediately. The session must exist.
    Result<std::string> start_process(const std::string& session_id,
                                      const std::string& command);
    Result<std::string> start_process(const std::string& session_id,
                                      const std::string& command,
                                      const PollingConfig& options);

    // Incremental: output since the last poll. Full: the whole buffer.
    // Either way the read cursor moves to the end.
    Result<PollResult> poll(const std::string& process_id, bool incremental = true);

    // Send Ctrl+C and mark stopped. Unknown ids and finished records are ignored.
    void stop_process(const std::string& process_id);

    std::vector<ProcessInfo> get_active_processes() const;
    std::vector<ProcessInfo> get_all_processes() const;
    std::optional<BackgroundProcess> get_process(const std::string& process_id) const;

    // Drop completed, error and stopped records. Returns how many.
    int cleanup_completed();

    // Worker threads not yet joined.
    size_t worker_count() const;

private:
    void run_process(std::shared_ptr<BackgroundProcess> process,
                     std::shared_ptr<TerminalSession> session,
                     PtyHandle::ListenerId listener, int timeout_ms);
    void append_output(BackgroundProcess& process, const std::string& data);
    void reap_workers();

    SessionManager& sessions_;
    PollingConfig defaults_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<BackgroundProcess>> processes_;

    mutable std::mutex workers_mutex_;
    std::map<std::string, std::thread> workers_;
    std::vector<std::string> finished_workers_;
};
