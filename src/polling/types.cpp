#include "types.hpp"

const char* polling_status_name(PollingStatus status) {
    switch (status) {
        case PollingStatus::RUNNING:   return "running";
        case PollingStatus::PAUSED:    return "paused";
        case PollingStatus::COMPLETED: return "completed";
        case PollingStatus::ERROR:     return "error";
        case PollingStatus::STOPPED:   return "stopped";
    }
    return "unknown";
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}
