#include "output_cleaner.hpp"
#include <core/utils.hpp>
#include <regex>
#include <vector>

namespace {

// ── Control sequences ───────────────────────────────────────
// OSC:  ESC ] ... BEL | ESC ] ... ESC \   (window titles, cwd reports)
const std::regex& osc_re() {
    static const std::regex re("\x1b\\][^\x07\x1b]*(\x07|\x1b\\\\)");
    return re;
}
// CSI: ESC [ params intermediates final  (SGR, cursor, erase, ?2004h ...)
const std::regex& csi_re() {
    static const std::regex re("\x1b\\[[0-9;?<>=!]*[ -/]*[@-~]");
    return re;
}
// Charset designation and line attributes: ESC ( B, ESC # 8 ...
const std::regex& charset_re() {
    static const std::regex re("\x1b[()#+.*][A-Za-z0-9]?");
    return re;
}
// Keypad modes: ESC > / ESC = / ESC <
const std::regex& keypad_re() {
    static const std::regex re("\x1b[><=]");
    return re;
}
// Private mode toggles whose ESC (or ESC [) was eaten upstream.
const std::regex& residual_bracket_mode_re() {
    static const std::regex re("\\[\\?[0-9]+[hl]");
    return re;
}
const std::regex& residual_mode_re() {
    static const std::regex re("\\?[0-9]+[hl]");
    return re;
}
const std::regex& blank_run_re() {
    static const std::regex re("\n{3,}");
    return re;
}

// ── Marker echo ─────────────────────────────────────────────
const std::regex& marker_echo_re() {
    static const std::regex re("^echo\\s+['\"].*===");
    return re;
}

// ── Prompt shapes ───────────────────────────────────────────
const std::vector<std::regex>& prompt_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("^\\(.+\\)\\s*[@$#]"),                          // (base) $
        std::regex("^\\[.+\\][@$#]"),                              // [READY]$
        std::regex("^[$#>]\\s*$"),                                 // $  #  >
        std::regex("^\xe2\x9d\xaf\\s*$"),                          // ❯
        std::regex("^~\\s*$"),
        std::regex("^%\\s*$"),
        std::regex("^[A-Za-z0-9_.-]+@[A-Za-z0-9_.-]+:~?\\s*$"),     // user@host:~
        std::regex("^[A-Za-z0-9_.-]+@[A-Za-z0-9_.-]+:\\S*[$#]\\s*$"), // user@host:/path$
        std::regex("^\\(.*\\).*@.*:.*\\$echo"),                      // (env)user@host:~$echo'===...
        std::regex("^.*@.*:.*\\$echo"),                               // user@host:~$echo'===...
    };
    return patterns;
}

std::string rtrim(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string erase_all(const std::string& text, char c) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        if (ch != c) out += ch;
    }
    return out;
}

} // namespace

std::string clean_output(const std::string& output) {
    std::string result = output;

    result = std::regex_replace(result, osc_re(), "");
    result = std::regex_replace(result, csi_re(), "");
    result = std::regex_replace(result, charset_re(), "");
    result = std::regex_replace(result, keypad_re(), "");
    result = std::regex_replace(result, residual_bracket_mode_re(), "");
    result = std::regex_replace(result, residual_mode_re(), "");

    // CRLF and lone CR both become LF
    std::string normalized;
    normalized.reserve(result.size());
    for (size_t i = 0; i < result.size(); ++i) {
        char c = result[i];
        if (c == '\r') {
            normalized += '\n';
            if (i + 1 < result.size() && result[i + 1] == '\n') ++i;
        } else {
            normalized += c;
        }
    }
    result = std::move(normalized);

    result = erase_all(result, '\x08');
    result = erase_all(result, '\x07');
    result = erase_all(result, '\x1b');  // any ESC that matched nothing above

    result = std::regex_replace(result, blank_run_re(), "\n\n");

    auto lines = split_lines(result);
    for (auto& line : lines) line = rtrim(line);
    result = join_lines(lines);

    trim(result);
    return result;
}

std::string clean_markers(const std::string& output, const MarkerSet& markers) {
    std::vector<std::string> kept;
    for (const auto& line : split_lines(output)) {
        std::string t = trimmed(line);
        if (!markers.start.empty() && t.find(markers.start) != std::string::npos) continue;
        if (!markers.end.empty() && t.find(markers.end) != std::string::npos) continue;
        if (!markers.exit.empty() && t.find(markers.exit) != std::string::npos) continue;
        if (std::regex_search(t, marker_echo_re())) continue;
        kept.push_back(line);
    }
    return join_lines(kept);
}

std::string clean_command_echo(const std::string& output, const std::string& command) {
    std::string first_word = command.substr(0, command.find(' '));
    bool echo_skipped = false;

    std::vector<std::string> kept;
    for (const auto& line : split_lines(output)) {
        std::string t = trimmed(line);
        if (t.empty()) continue;

        if (!echo_skipped && !first_word.empty() &&
            t.find(first_word) != std::string::npos) {
            echo_skipped = true;
            continue;
        }
        kept.push_back(line);
    }
    return join_lines(kept);
}

std::string clean_prompt(const std::string& output) {
    std::vector<std::string> kept;
    for (const auto& line : split_lines(output)) {
        std::string t = trimmed(line);

        bool is_prompt = false;
        for (const auto& re : prompt_patterns()) {
            if (std::regex_search(t, re)) {
                is_prompt = true;
                break;
            }
        }
        if (!is_prompt &&
            (t.find("echo'===") != std::string::npos ||
             t.find("echo \"===") != std::string::npos)) {
            is_prompt = true;
        }
        if (!is_prompt) kept.push_back(line);
    }
    return join_lines(kept);
}

std::string full_clean_output(const std::string& output,
                              const std::string& command,
                              const std::optional<MarkerSet>& markers) {
    std::string result = clean_output(output);
    if (markers) {
        result = clean_markers(result, *markers);
    }
    result = clean_command_echo(result, command);
    result = clean_prompt(result);
    trim(result);
    return result;
}
