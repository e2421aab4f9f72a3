#include "output_poller.hpp"
#include <session/session_manager.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <system_error>

namespace {

ProcessInfo to_info(const BackgroundProcess& p) {
    return {p.id, p.session_id, p.command, p.status,
            p.created_at, p.updated_at, p.output_buffer.size()};
}

} // namespace

OutputPoller::OutputPoller(SessionManager& sessions, PollingConfig defaults)
    : sessions_(sessions), defaults_(defaults) {}

OutputPoller::~OutputPoller() {
    std::map<std::string, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
        finished_workers_.clear();
    }
    for (auto& [id, t] : workers) {
        if (t.joinable()) t.join();
    }
}

void OutputPoller::reap_workers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& id : finished_workers_) {
            auto it = workers_.find(id);
            if (it == workers_.end()) continue;
            done.push_back(std::move(it->second));
            workers_.erase(it);
        }
        finished_workers_.clear();
    }
    // Each has already left run_process; join only waits for the thread exit.
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

size_t OutputPoller::worker_count() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

Result<std::string> OutputPoller::start_process(const std::string& session_id,
                                                const std::string& command) {
    return start_process(session_id, command, defaults_);
}

Result<std::string> OutputPoller::start_process(const std::string& session_id,
                                                const std::string& command,
                                                const PollingConfig& options) {
    reap_workers();

    auto session = sessions_.get_session(session_id);
    if (!session) {
        return Result<std::string>::Err(ErrorCode::SESSION_NOT_FOUND,
                                        errors::session_not_found(session_id));
    }

    auto process = std::make_shared<BackgroundProcess>();
    process->id = generate_uuid();
    process->session_id = session_id;
    process->command = command;
    process->created_at = Clock::now();
    process->updated_at = process->created_at;
    process->interval_ms = options.interval_ms;
    process->max_buffer_size = options.max_buffer_size;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_[process->id] = process;
    }

    // Holds the record: cleanup may drop a stopped one before the command ends.
    auto listener = session->pty->on_data([this, process](const std::string& data) {
        append_output(*process, data);
    });

    termkeep_log(fmt::format("bg {}: start in session {}: {}",
                             process->id, session_id, command));

    try {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace(process->id, std::thread(&OutputPoller::run_process, this,
                                                  process, session, listener,
                                                  options.timeout_ms));
    } catch (const std::system_error& e) {
        session->pty->remove_listener(listener);
        std::string error = fmt::format("Failed to start worker: {}", e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            process->status = PollingStatus::ERROR;
            process->error = error;
            process->updated_at = Clock::now();
        }
        termkeep_log(fmt::format("bg {}: {}", process->id, error));
        return Result<std::string>::Err(ErrorCode::PROCESS_START_FAILED, error);
    }
    return Result<std::string>::Ok(process->id);
}

void OutputPoller::append_output(BackgroundProcess& process, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    process.output_buffer += data;
    process.updated_at = Clock::now();

    if (process.output_buffer.size() > process.max_buffer_size) {
        size_t excess = process.output_buffer.size() - process.max_buffer_size;
        process.output_buffer.erase(0, excess);
        process.read_position = process.read_position > excess
            ? process.read_position - excess : 0;
    }
}

// ── Worker thread ───────────────────────────────────────────

void OutputPoller::run_process(std::shared_ptr<BackgroundProcess> process,
                               std::shared_ptr<TerminalSession> session,
                               PtyHandle::ListenerId listener, int timeout_ms) {
    auto finish = [&](bool ok, std::optional<int> exit_code, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        process->updated_at = Clock::now();
        if (is_terminal(process->status)) return;   // stopped meanwhile
        process->status = ok ? PollingStatus::COMPLETED : PollingStatus::ERROR;
        process->exit_code = exit_code;
        process->error = error;
    };

    CommandContext ctx;
    ctx.session_id = process->session_id;
    ctx.command = process->command;
    ctx.timeout_ms = timeout_ms;
    // The session resolved at start; a close since then fails the record.
    auto result = sessions_.execute_command(session, ctx);

    session->pty->remove_listener(listener);

    if (result.is_err()) {
        finish(false, std::nullopt, result.error);
        termkeep_log(fmt::format("bg {}: error: {}", process->id, result.error));
    } else {
        const auto& r = result.value;
        finish(r.success, r.exit_code, r.error);
        termkeep_log(fmt::format("bg {}: {} exit={}", process->id,
                                 r.success ? "completed" : "error",
                                 r.exit_code ? std::to_string(*r.exit_code) : "none"));
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    finished_workers_.push_back(process->id);
}

// ── Queries ─────────────────────────────────────────────────

Result<PollResult> OutputPoller::poll(const std::string& process_id, bool incremental) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(process_id);
    if (it == processes_.end()) {
        return Result<PollResult>::Err(ErrorCode::PROCESS_NOT_FOUND,
                                       errors::process_not_found(process_id));
    }
    auto& p = *it->second;
    auto now = Clock::now();

    PollResult r;
    r.process_id = p.id;
    r.session_id = p.session_id;
    if (incremental) {
        r.output = p.output_buffer.substr(std::min(p.read_position, p.output_buffer.size()));
        r.has_new_content = !r.output.empty();
    } else {
        r.output = p.output_buffer;
        r.has_new_content = p.read_position < p.output_buffer.size();
    }
    p.read_position = p.output_buffer.size();
    p.updated_at = now;

    r.status = p.status;
    r.is_complete = p.status == PollingStatus::COMPLETED || p.status == PollingStatus::ERROR;
    r.exit_code = p.exit_code;
    r.error = p.error;
    r.timestamp = now;
    return Result<PollResult>::Ok(r);
}

void OutputPoller::stop_process(const std::string& process_id) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(process_id);
        if (it == processes_.end() || is_terminal(it->second->status)) return;
        session_id = it->second->session_id;
    }

    if (auto session = sessions_.get_session(session_id)) {
        session->pty->write(INTERRUPT_SEQUENCE);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(process_id);
    if (it == processes_.end() || is_terminal(it->second->status)) return;
    it->second->status = PollingStatus::STOPPED;
    it->second->updated_at = Clock::now();
    termkeep_log(fmt::format("bg {}: stopped", process_id));
}

std::vector<ProcessInfo> OutputPoller::get_active_processes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProcessInfo> out;
    for (const auto& [id, p] : processes_) {
        if (p->status == PollingStatus::RUNNING) out.push_back(to_info(*p));
    }
    return out;
}

std::vector<ProcessInfo> OutputPoller::get_all_processes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProcessInfo> out;
    for (const auto& [id, p] : processes_) out.push_back(to_info(*p));
    return out;
}

std::optional<BackgroundProcess> OutputPoller::get_process(const std::string& process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(process_id);
    if (it == processes_.end()) return std::nullopt;
    return *it->second;
}

int OutputPoller::cleanup_completed() {
    reap_workers();

    std::lock_guard<std::mutex> lock(mutex_);
    int cleaned = 0;
    for (auto it = processes_.begin(); it != processes_.end();) {
        if (is_terminal(it->second->status)) {
            it = processes_.erase(it);
            ++cleaned;
        } else {
            ++it;
        }
    }
    return cleaned;
}
