#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

static std::string level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return theme::red("ERROR");
        case LogLevel::WARN:  return theme::yellow("WARN ");
        case LogLevel::DEBUG: return theme::dim("DEBUG");
        default:              return theme::accent("INFO ");
    }
}

static void print_entries(const std::vector<LogEntry>& entries) {
    if (entries.empty()) {
        std::cout << theme::dim("    (no entries)") << "\n";
        return;
    }
    for (const auto& e : entries) {
        std::cout << "    " << level_tag(e.level) << " " << e.content << "\n";
    }
}

static void report_tail_error(BaseCLI& cli, const std::string& tail_id) {
    auto state = cli.tailer->get_tail(tail_id);
    if (state && state->status == PollingStatus::ERROR) {
        std::cout << theme::fail(state->error);
    }
}

// tail <path> [lines] [--once]
static void do_tail(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    auto words = split_args(arg);
    if (words.empty()) {
        std::cout << "Usage: tail <path> [lines] [--once]\n";
        return;
    }

    TailOptions options;
    options.lines = cli.config->tail().lines;
    options.timeout_ms = cli.config->tail().timeout_ms;
    for (size_t i = 1; i < words.size(); ++i) {
        if (words[i] == "--once") {
            options.follow = false;
        } else {
            options.lines = safe_stoi(words[i], options.lines);
        }
    }

    auto session = cli.sessions->get_or_create_session(cli.current_session);
    if (session.is_err()) {
        std::cout << theme::fail(error_code_name(session.code), session.error);
        return;
    }

    auto result = cli.tailer->start_tailing(cli.current_session, words[0], options);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    print_entries(result.value.entries);
    report_tail_error(cli, result.value.tail_id);
    std::cout << theme::ok("Tail " + result.value.tail_id);
    if (options.follow) {
        std::cout << theme::step("more " + result.value.tail_id);
    }
}

// logs <tail-id> [since]
static void do_logs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    auto words = split_args(arg);
    if (words.empty()) {
        std::cout << "Usage: logs <tail-id> [since YYYY-MM-DDTHH:MM:SS]\n";
        return;
    }

    std::optional<TimePoint> since;
    if (words.size() > 1) {
        since = parse_iso8601(words[1]);
        if (!since) {
            std::cout << theme::fail("Not a timestamp: " + words[1]);
            return;
        }
    }

    auto result = cli.tailer->get_logs(words[0], since);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    print_entries(result.value);
    report_tail_error(cli, words[0]);
}

static void do_more(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << "Usage: more <tail-id>\n";
        return;
    }
    auto result = cli.tailer->get_incremental_logs(arg);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    print_entries(result.value);
    report_tail_error(cli, arg);
}

static void do_untail(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << "Usage: untail <tail-id>\n";
        return;
    }
    if (!cli.tailer->get_tail(arg)) {
        std::cout << theme::fail(errors::tail_not_found(arg));
        return;
    }
    cli.tailer->stop_tailing(arg);
    std::cout << theme::ok("Stopped " + arg);
}

void register_tail_commands(BaseCLI& cli) {
    cli.add_command("tail", do_tail, "Follow a file <path> [lines] [--once]");
    cli.add_command("logs", do_logs, "Whole file as log entries <id> [since]");
    cli.add_command("more", do_more, "Entries appended since the last read");
    cli.add_command("untail", do_untail, "Stop following a file");
}
