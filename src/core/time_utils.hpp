#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Format an ISO timestamp (YYYY-MM-DDTHH:MM:SS) to "HH:MM" display.
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);

// Parse a log-style ISO 8601 timestamp:
//   YYYY-MM-DD[T ]HH:MM:SS[.fraction][Z|+HH:MM|+HHMM|-HH:MM|-HHMM]
// Without a zone designator the time is taken as local time.
std::optional<TimePoint> parse_iso8601(const std::string& text);

// Local-time ISO rendering of a time point, with milliseconds.
std::string format_time_point(TimePoint tp);

// "1.2s", "340ms"
std::string format_elapsed_ms(long long ms);
