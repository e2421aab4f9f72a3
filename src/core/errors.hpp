#pragma once

#include <string>

// Failure categories carried by Result<T>. Precondition and capacity
// violations are reported with one of these; runtime outcomes such as a
// command timing out are reported as result fields instead.
enum class ErrorCode {
    NONE,

    // Sessions
    SESSION_NOT_FOUND,
    SESSION_ALREADY_EXISTS,
    SESSION_BUSY,
    SESSION_CLOSED,
    MAX_SESSIONS_REACHED,
    SESSION_CREATE_FAILED,

    // Commands
    COMMAND_TIMEOUT,
    COMMAND_FAILED,
    COMMAND_EMPTY,

    // Background processes and tails
    PROCESS_NOT_FOUND,
    PROCESS_START_FAILED,
    TAIL_NOT_FOUND,

    // Files (surfaced by collaborators)
    FILE_NOT_FOUND,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,

    // Backends
    BACKEND_NOT_AVAILABLE,
    BACKEND_ERROR,
    DOCKER_NOT_AVAILABLE,

    INVALID_PARAMETER,
    INTERNAL_ERROR,
};

// Stable upper-case name, e.g. "SESSION_BUSY".
const char* error_code_name(ErrorCode code);

// Message builders, one per failure the store and pollers raise.
namespace errors {
std::string session_not_found(const std::string& session_id);
std::string session_already_exists(const std::string& session_id);
std::string session_busy(const std::string& session_id);
std::string session_closed(const std::string& session_id);
std::string max_sessions_reached(int max_sessions);
std::string session_create_failed(const std::string& reason);
std::string command_empty();
std::string command_timeout(long long timeout_ms);
std::string process_not_found(const std::string& process_id);
std::string tail_not_found(const std::string& tail_id);
std::string backend_error(const std::string& backend, const std::string& reason);
}
