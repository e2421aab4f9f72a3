#include "termkeep_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <fmt/format.h>
#include <core/config.hpp>
#include <readline/readline.h>
#include <readline/history.h>

TermkeepCLI::TermkeepCLI() : BaseCLI() {
    register_all_commands();
}

void TermkeepCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Closing sessions...") << "\n";
        cli.quit_requested = true;
    }, "Close all sessions and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Closing sessions...") << "\n";
        cli.quit_requested = true;
    }, "Close all sessions and exit");

    register_session_commands(*this);
    register_background_commands(*this);
    register_tail_commands(*this);
    register_info_commands(*this);
}

void TermkeepCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Starting");
    if (!require_runtime()) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::check(fmt::format("Backend {} ready", backend_type_name(backend->type())));
    std::cout << theme::kv("Shell", backend->default_shell());
    std::cout << theme::kv("Directory", backend->default_cwd());
    std::cout << theme::kv("Sessions", fmt::format("up to {}", config->sessions().max_sessions));
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        // Idle sessions are swept between commands
        int expired = sessions->close_expired_sessions();
        if (expired > 0) {
            std::cout << theme::info(fmt::format("Closed {} idle session(s).", expired));
        }

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    stop_runtime();
}

int TermkeepCLI::run_init() {
    auto path = get_config_path();
    if (config_exists()) {
        std::cout << theme::info("Config already exists: " + path.string());
        return 0;
    }
    auto result = create_default_config(path);
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + path.string());
    return 0;
}

int TermkeepCLI::run_once(const std::string& command) {
    if (!require_runtime()) return 1;

    auto created = sessions->create_session();
    if (created.is_err()) {
        std::cerr << created.error << "\n";
        return 1;
    }

    CommandContext ctx;
    ctx.session_id = created.value->id;
    ctx.command = command;
    auto result = sessions->execute_command(ctx);
    stop_runtime();

    if (result.is_err()) {
        std::cerr << result.error << "\n";
        return 1;
    }
    if (!result.value.output.empty()) {
        std::cout << result.value.output << "\n";
    }
    if (result.value.timed_out) {
        std::cerr << result.value.error << "\n";
        return 124;
    }
    return result.value.exit_code.value_or(0);
}
