#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Milliseconds since the Unix epoch.
int64_t epoch_ms();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
int64_t safe_stoll(const std::string& s, int64_t fallback = 0);

// Random RFC 4122 version-4 identifier.
std::string generate_uuid();

// Quote a string for a POSIX shell: 'it'\''s'.
std::string shell_quote(const std::string& s);

std::string to_lower(std::string s);

// Split on '\n', keeping empty lines.
std::vector<std::string> split_lines(const std::string& text);

std::string join_lines(const std::vector<std::string>& lines);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
