#include "session.hpp"
#include <backends/backend.hpp>

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::INITIALIZING: return "initializing";
        case SessionStatus::READY:        return "ready";
        case SessionStatus::BUSY:         return "busy";
        case SessionStatus::ERROR:        return "error";
        case SessionStatus::CLOSED:       return "closed";
    }
    return "unknown";
}

TerminalSession::TerminalSession(std::string id_, std::string name_,
                                 std::shared_ptr<Backend> backend_,
                                 std::string cwd_, EnvMap env_,
                                 std::size_t max_buffer_size_)
    : id(std::move(id_)),
      name(std::move(name_)),
      backend(std::move(backend_)),
      cwd(std::move(cwd_)),
      env(std::move(env_)),
      max_buffer_size(max_buffer_size_),
      created_at(Clock::now()),
      last_activity_at(created_at) {}

void TerminalSession::append_output(const std::string& data) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        output_buffer += data;
        if (output_buffer.size() > max_buffer_size) {
            output_buffer.erase(0, output_buffer.size() - max_buffer_size);
        }
    }
    output_cv.notify_all();
}

SessionStatus TerminalSession::get_status() const {
    std::lock_guard<std::mutex> lock(mutex);
    return status;
}

std::string TerminalSession::buffer_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return output_buffer;
}

SessionInfo TerminalSession::info() const {
    std::lock_guard<std::mutex> lock(mutex);
    return {id, name, status, last_command, cwd, error, created_at, last_activity_at};
}
