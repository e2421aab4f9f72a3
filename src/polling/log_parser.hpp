#pragma once

#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

// Recognized line shapes, tried in order:
//   2024-01-15T10:30:00.123Z message     timestamp taken from the line
//   [LEVEL] message                       level taken from the tag
//   anything else                         whole line, stamped `received`
LogEntry parse_log_line(const std::string& line, TimePoint received = Clock::now());

// Keyword scan, case-insensitive: error/err/fatal, warn, debug/trace, else info.
LogLevel detect_log_level(const std::string& content);

// Explicit tag from a "[LEVEL]" prefix; nullopt for tags it does not know.
std::optional<LogLevel> level_from_tag(const std::string& tag);

// Parse every non-blank line, keeping entries stamped at or after `since`.
std::vector<LogEntry> parse_log_text(const std::string& text,
                                     std::optional<TimePoint> since = std::nullopt,
                                     TimePoint received = Clock::now());
