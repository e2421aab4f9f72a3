#include "errors.hpp"
#include <fmt/format.h>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                   return "NONE";
        case ErrorCode::SESSION_NOT_FOUND:      return "SESSION_NOT_FOUND";
        case ErrorCode::SESSION_ALREADY_EXISTS: return "SESSION_ALREADY_EXISTS";
        case ErrorCode::SESSION_BUSY:           return "SESSION_BUSY";
        case ErrorCode::SESSION_CLOSED:         return "SESSION_CLOSED";
        case ErrorCode::MAX_SESSIONS_REACHED:   return "MAX_SESSIONS_REACHED";
        case ErrorCode::SESSION_CREATE_FAILED:  return "SESSION_CREATE_FAILED";
        case ErrorCode::COMMAND_TIMEOUT:        return "COMMAND_TIMEOUT";
        case ErrorCode::COMMAND_FAILED:         return "COMMAND_FAILED";
        case ErrorCode::COMMAND_EMPTY:          return "COMMAND_EMPTY";
        case ErrorCode::PROCESS_NOT_FOUND:      return "PROCESS_NOT_FOUND";
        case ErrorCode::PROCESS_START_FAILED:   return "PROCESS_START_FAILED";
        case ErrorCode::TAIL_NOT_FOUND:         return "TAIL_NOT_FOUND";
        case ErrorCode::FILE_NOT_FOUND:         return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR:        return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:       return "FILE_WRITE_ERROR";
        case ErrorCode::BACKEND_NOT_AVAILABLE:  return "BACKEND_NOT_AVAILABLE";
        case ErrorCode::BACKEND_ERROR:          return "BACKEND_ERROR";
        case ErrorCode::DOCKER_NOT_AVAILABLE:   return "DOCKER_NOT_AVAILABLE";
        case ErrorCode::INVALID_PARAMETER:      return "INVALID_PARAMETER";
        case ErrorCode::INTERNAL_ERROR:         return "INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR";
}

namespace errors {

std::string session_not_found(const std::string& session_id) {
    return fmt::format("Session not found: {}", session_id);
}

std::string session_already_exists(const std::string& session_id) {
    return fmt::format("Session already exists: {}", session_id);
}

std::string session_busy(const std::string& session_id) {
    return fmt::format("Session is busy: {}", session_id);
}

std::string session_closed(const std::string& session_id) {
    return fmt::format("Session is closed: {}", session_id);
}

std::string max_sessions_reached(int max_sessions) {
    return fmt::format("Maximum number of sessions reached: {}", max_sessions);
}

std::string session_create_failed(const std::string& reason) {
    return fmt::format("Failed to create session: {}", reason);
}

std::string command_empty() {
    return "Command cannot be empty";
}

std::string command_timeout(long long timeout_ms) {
    return fmt::format("Command timeout after {}ms", timeout_ms);
}

std::string process_not_found(const std::string& process_id) {
    return fmt::format("Process not found: {}", process_id);
}

std::string tail_not_found(const std::string& tail_id) {
    return fmt::format("Tail not found: {}", tail_id);
}

std::string backend_error(const std::string& backend, const std::string& reason) {
    return fmt::format("Backend error ({}): {}", backend, reason);
}

} // namespace errors
