#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>

static void do_bg(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << "Usage: bg <command>\n";
        return;
    }

    // Background commands need a live session to attach to
    auto session = cli.sessions->get_or_create_session(cli.current_session);
    if (session.is_err()) {
        std::cout << theme::fail(error_code_name(session.code), session.error);
        return;
    }

    auto result = cli.poller->start_process(cli.current_session, arg);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    std::cout << theme::ok("Started " + result.value);
    std::cout << theme::step("poll " + result.value);
}

static void do_poll(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    auto words = split_args(arg);
    if (words.empty()) {
        std::cout << "Usage: poll <process-id> [--full]\n";
        return;
    }
    bool full = words.size() > 1 && words[1] == "--full";

    auto result = cli.poller->poll(words[0], !full);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }

    const auto& poll = result.value;
    if (poll.has_new_content) {
        std::cout << theme::block(poll.output);
    } else {
        std::cout << theme::dim("    (no new output)") << "\n";
    }

    std::string status = polling_status_name(poll.status);
    if (poll.exit_code) status += fmt::format(", exit {}", *poll.exit_code);
    if (poll.status == PollingStatus::ERROR) {
        std::cout << theme::fail(status + (poll.error.empty() ? "" : ": " + poll.error));
    } else {
        std::cout << theme::log(status);
    }
}

static void do_stop(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << "Usage: stop <process-id>\n";
        return;
    }
    if (!cli.poller->get_process(arg)) {
        std::cout << theme::fail(errors::process_not_found(arg));
        return;
    }
    cli.poller->stop_process(arg);
    std::cout << theme::ok("Stopped " + arg);
}

static void do_ps(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;

    auto list = arg == "--all" ? cli.poller->get_all_processes()
                               : cli.poller->get_active_processes();
    if (list.empty()) {
        std::cout << theme::dim("    No background processes.") << "\n";
        return;
    }

    std::cout << theme::section("Background processes");
    for (const auto& p : list) {
        auto started = format_time_point(p.created_at);
        auto ended = is_terminal(p.status) ? format_time_point(p.updated_at) : "";
        std::cout << fmt::format("    {:<38} {:<10} {:>7} {:>9}B  {}\n",
                                 p.id, polling_status_name(p.status),
                                 format_duration(started, ended),
                                 p.output_length, theme::dim(p.command));
    }
    std::cout << "\n";
}

static void do_cleanup(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    int processes = cli.poller->cleanup_completed();
    int tails = cli.tailer->cleanup_stopped();
    std::cout << theme::ok(fmt::format("Removed {} process(es), {} tail(s).", processes, tails));
}

void register_background_commands(BaseCLI& cli) {
    cli.add_command("bg", do_bg, "Run a command in the background");
    cli.add_command("poll", do_poll, "Show new output <id> [--full]");
    cli.add_command("stop", do_stop, "Interrupt a background command");
    cli.add_command("ps", do_ps, "List background commands [--all]");
    cli.add_command("cleanup", do_cleanup, "Forget finished processes and tails");
}
