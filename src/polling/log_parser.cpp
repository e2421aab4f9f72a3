#include "log_parser.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <regex>

namespace {

const std::regex& iso_line_re() {
    static const std::regex re(
        "^(\\d{4}-\\d{2}-\\d{2}[T ]\\d{2}:\\d{2}:\\d{2}(?:\\.\\d+)?(?:Z|[+-]\\d{2}:?\\d{2})?)\\s*(.*)$");
    return re;
}

const std::regex& tagged_line_re() {
    static const std::regex re("^\\[(\\w+)\\]\\s*(.*)$");
    return re;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

LogLevel detect_log_level(const std::string& content) {
    std::string lower = to_lower(content);
    if (contains(lower, "error") || contains(lower, "err") || contains(lower, "fatal")) {
        return LogLevel::ERROR;
    }
    if (contains(lower, "warn")) return LogLevel::WARN;
    if (contains(lower, "debug") || contains(lower, "trace")) return LogLevel::DEBUG;
    return LogLevel::INFO;
}

std::optional<LogLevel> level_from_tag(const std::string& tag) {
    std::string t = to_lower(tag);
    if (t == "debug" || t == "trace") return LogLevel::DEBUG;
    if (t == "info") return LogLevel::INFO;
    if (t == "warn" || t == "warning") return LogLevel::WARN;
    if (t == "error" || t == "err" || t == "fatal" || t == "critical") return LogLevel::ERROR;
    return std::nullopt;
}

LogEntry parse_log_line(const std::string& raw_line, TimePoint received) {
    std::string line = raw_line;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    std::smatch m;

    if (std::regex_match(line, m, iso_line_re())) {
        LogEntry entry;
        entry.timestamp = parse_iso8601(m[1].str()).value_or(received);
        entry.content = m[2].str();
        entry.level = detect_log_level(entry.content);
        return entry;
    }

    if (std::regex_match(line, m, tagged_line_re())) {
        LogEntry entry;
        entry.timestamp = received;
        entry.content = m[2].str();
        entry.level = level_from_tag(m[1].str()).value_or(detect_log_level(line));
        return entry;
    }

    return {received, line, detect_log_level(line)};
}

std::vector<LogEntry> parse_log_text(const std::string& text,
                                     std::optional<TimePoint> since,
                                     TimePoint received) {
    std::vector<LogEntry> entries;
    for (const auto& line : split_lines(text)) {
        if (trimmed(line).empty()) continue;
        auto entry = parse_log_line(line, received);
        if (since && entry.timestamp < *since) continue;
        entries.push_back(std::move(entry));
    }
    return entries;
}
