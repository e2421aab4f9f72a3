#include "marker_protocol.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

MarkerSet make_markers(int64_t id) {
    return {
        fmt::format("===START{}===", id),
        fmt::format("===END{}===", id),
        fmt::format("===EXIT{}===", id),
    };
}

std::vector<std::string> build_marker_writes(const MarkerSet& markers,
                                             const std::string& command) {
    return {
        "echo '" + markers.start + "'\n",
        command + "\n",
        "echo '" + markers.exit + "'$?\n",
        "echo '" + markers.end + "'\n",
    };
}

std::optional<int> find_exit_code(const std::string& raw, const std::string& exit_marker) {
    size_t pos = 0;
    while ((pos = raw.find(exit_marker, pos)) != std::string::npos) {
        size_t digits = pos + exit_marker.size();
        size_t end = digits;
        while (end < raw.size() && std::isdigit(static_cast<unsigned char>(raw[end]))) {
            ++end;
        }
        // The echoed command line carries the marker followed by a quote.
        if (end > digits) {
            return safe_stoi(raw.substr(digits, end - digits), 0);
        }
        pos = digits;
    }
    return std::nullopt;
}

bool marker_printed(const std::string& raw, const std::string& marker) {
    size_t pos = 0;
    while ((pos = raw.find(marker, pos)) != std::string::npos) {
        size_t next = pos + marker.size();
        if (next < raw.size() && (raw[next] == '\r' || raw[next] == '\n')) {
            return true;
        }
        pos = next;
    }
    return false;
}

MarkerResult parse_marker_output(const std::string& raw,
                                 const MarkerSet& markers,
                                 const std::string& command) {
    // Last occurrences: the printed marker follows its own echoed command line.
    auto start_pos = raw.rfind(markers.start);
    auto end_pos = raw.rfind(markers.end);

    if (start_pos == std::string::npos || end_pos == std::string::npos ||
        end_pos <= start_pos) {
        return {clean_output(raw), 0, false};
    }

    int exit_code = find_exit_code(raw, markers.exit).value_or(0);

    auto content_start = start_pos + markers.start.size();
    std::string between = raw.substr(content_start, end_pos - content_start);

    return {full_clean_output(between, command, markers), exit_code, true};
}
