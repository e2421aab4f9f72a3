#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <iomanip>

// ISO timestamp parsing (YYYY-MM-DDTHH:MM:SS)
static bool parse_iso(const char* s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time.c_str(), &start_tm)) {
        return "?";
    }
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t;
    if (!end_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(end_time.c_str(), &end_tm)) {
            return "?";
        }
        end_t = mktime(&end_tm);
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time.c_str(), &tm_buf)) {
        return "?";
    }

    // Format as "8:13pm" (12-hour with am/pm)
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    // Strip leading zero and lowercase am/pm: "08:13PM" → "8:13pm"
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    int year, mon, day, hour, min, sec;
    char sep;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &mon, &day, &sep, &hour, &min, &sec, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != ' ') return std::nullopt;
    if (mon < 1 || mon > 12 || day < 1 || day > 31 ||
        hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);

    // Fractional seconds, millisecond precision
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int d = digits; d < 3; ++d) millis *= 10;
    }

    struct tm tm_buf = {};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = mon - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = min;
    tm_buf.tm_sec = sec;

    std::time_t t;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        t = timegm(&tm_buf);
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '+' ? 1 : -1;
        int oh = 0, om = 0;
        std::string zone = text.substr(pos + 1);
        if (std::sscanf(zone.c_str(), "%2d:%2d", &oh, &om) != 2 &&
            std::sscanf(zone.c_str(), "%2d%2d", &oh, &om) != 2) {
            return std::nullopt;
        }
        t = timegm(&tm_buf) - sign * (oh * 3600 + om * 60);
    } else {
        tm_buf.tm_isdst = -1;
        t = mktime(&tm_buf);
    }
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    return Clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

std::string format_time_point(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}", buf, static_cast<int>(ms));
}

std::string format_elapsed_ms(long long ms) {
    if (ms < 1000) return fmt::format("{}ms", ms);
    return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
}
