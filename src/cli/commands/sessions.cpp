#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>

static const char* status_color(SessionStatus status) {
    switch (status) {
        case SessionStatus::READY:  return theme::color::GREEN.c_str();
        case SessionStatus::BUSY:   return theme::color::YELLOW.c_str();
        case SessionStatus::ERROR:
        case SessionStatus::CLOSED: return theme::color::RED.c_str();
        default:                    return theme::color::GRAY.c_str();
    }
}

static void print_result(const CommandResult& result) {
    std::cout << theme::block(result.output);
    if (result.timed_out) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        std::cout << theme::dim("    The command may still be running in the shell.") << "\n";
        return;
    }
    std::string summary = fmt::format("exit {} in {}",
                                      result.exit_code.value_or(0),
                                      format_elapsed_ms(result.duration_ms));
    if (result.success) {
        std::cout << theme::log(summary);
    } else {
        std::cout << theme::fail(summary);
    }
}

static void do_new(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;

    SessionOptions options;
    auto words = split_args(arg);
    if (!words.empty()) options.id = words[0];
    if (words.size() > 1) options.cwd = words[1];

    std::cout << theme::dim("    Starting shell...") << "\n";
    auto result = cli.sessions->create_session(options);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    cli.current_session = result.value->id;
    std::cout << theme::ok(fmt::format("Session {} ({})", result.value->id, result.value->name));
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << "Usage: use <session-id>\n";
        return;
    }
    if (!cli.sessions->get_session(arg)) {
        std::cout << theme::info("No session '" + arg + "' yet; it starts on the next exec.");
    }
    cli.current_session = arg;
}

static void do_sessions(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;

    auto list = cli.sessions->list_sessions();
    if (list.empty()) {
        std::cout << theme::dim("    No sessions.") << "\n";
        return;
    }

    std::cout << theme::section(fmt::format("Sessions ({}/{})", list.size(),
                                            cli.sessions->config().max_sessions));
    for (const auto& info : list) {
        std::string marker = info.id == cli.current_session ? "*" : " ";
        std::cout << fmt::format("  {} {:<38} {}{:<12}{} {:<8} {}\n",
                                 marker, info.id,
                                 status_color(info.status),
                                 session_status_name(info.status),
                                 theme::color::RESET,
                                 format_timestamp(format_time_point(info.created_at)),
                                 theme::dim(info.last_command));
        if (!info.error.empty()) {
            std::cout << theme::dim("      " + info.error) << "\n";
        }
    }
    std::cout << "\n";
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }

    CommandContext ctx;
    ctx.session_id = cli.current_session;
    ctx.command = arg;
    auto result = cli.sessions->execute_command(ctx);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    print_result(result.value);
}

static void do_close(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;

    if (arg == "all") {
        size_t n = cli.sessions->session_count();
        cli.sessions->close_all_sessions();
        cli.current_session = DEFAULT_SESSION_ID;
        std::cout << theme::ok(fmt::format("Closed {} session(s).", n));
        return;
    }

    std::string id = arg.empty() ? cli.current_session : arg;
    if (!cli.sessions->get_session(id)) {
        std::cout << theme::fail(errors::session_not_found(id));
        return;
    }
    cli.sessions->close_session(id);
    if (id == cli.current_session) cli.current_session = DEFAULT_SESSION_ID;
    std::cout << theme::ok("Closed " + id);
}

static void do_expire(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    int n = cli.sessions->close_expired_sessions();
    std::cout << theme::ok(fmt::format("Closed {} idle session(s).", n));
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("new", do_new, "Start a shell session [id] [cwd]");
    cli.add_command("use", do_use, "Switch the current session");
    cli.add_command("sessions", do_sessions, "List sessions");
    cli.add_command("exec", do_exec, "Run a command in the current session");
    cli.add_command("close", do_close, "Close a session [id|all]");
    cli.add_command("expire", do_expire, "Close sessions idle past the expiry");
}
