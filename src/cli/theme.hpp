#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// Palette (ANSI escape sequences)
// Accent:  #4C9A8A (teal)
// Heading: #B5873A (amber)
namespace color {
    const std::string ACCENT    = "\033[38;2;76;154;138m";
    const std::string HEADING   = "\033[38;2;181;135;58m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string accent(const std::string& s)  { return color::ACCENT + s + color::RESET; }
inline std::string heading(const std::string& s) { return color::HEADING + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Just the horizontal line (callers control gaps)
inline std::string rule(int width = 44) {
    std::string line = color::DIM + "  ";
    for (int i = 0; i < width; ++i) line += "\xe2\x94\x80";
    return line + color::RESET + "\n";
}

inline const char* version() { return "0.1.0"; }

// Banner: clears screen, then title + rule
inline std::string banner() {
    return
        "\033[2J\033[H\n"
        + color::ACCENT + color::BOLD
        + "  termkeep\n"
        + color::RESET + color::DIM + "  v" + version() + "\n"
        + "  Persistent shells, background jobs, log tails"
        + color::RESET + "\n\n"
        + rule();
}

// Section header, blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + bold(heading("  " + title)) + "\n\n";
}

// Divider: rule padded by blank lines
inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

// Failure tagged with its error code name
inline std::string fail(const char* code, const std::string& msg) {
    return color::RED + "    x " + color::RESET + dim(code) + " " + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::ACCENT + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::HEADING + "    > " + color::RESET + msg + "\n";
}

inline std::string check(const std::string& msg) {
    return color::GREEN + "    \xe2\x9c\x93 " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for info panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// Program output, indented to sit under the status markers
inline std::string block(const std::string& text) {
    if (text.empty()) return "";
    std::string out = "      ";
    for (char c : text) {
        out += c;
        if (c == '\n') out += "      ";
    }
    return out + "\n";
}

} // namespace theme
