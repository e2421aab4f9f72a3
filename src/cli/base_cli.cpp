#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>
#include <backends/backend_factory.hpp>
#include <core/log.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        set_termkeep_log_path(config->log_path());
    } else {
        config_error = config_result.error;
    }
}

BaseCLI::~BaseCLI() {
    stop_runtime();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Config could not be loaded: " + config_error);
        std::cout << theme::step("Fix " + get_config_path().string() + " or run 'termkeep init'.");
        return false;
    }
    return true;
}

bool BaseCLI::require_runtime() {
    if (sessions) return true;
    if (!require_config()) return false;

    auto backend_result = create_backend(config.value());
    if (backend_result.is_err()) {
        std::cout << theme::fail(error_code_name(backend_result.code), backend_result.error);
        return false;
    }
    if (!backend_result.value->is_available()) {
        std::cout << theme::fail(fmt::format("Backend '{}' is not available.",
                                             backend_type_name(backend_result.value->type())));
        return false;
    }

    backend = backend_result.value;
    sessions = std::make_unique<SessionManager>(backend, config->sessions());
    poller = std::make_unique<OutputPoller>(*sessions, config->polling());
    tailer = std::make_unique<LogTailer>(*sessions, config->tail());
    termkeep_log(fmt::format("cli: runtime started on {} backend",
                             backend_type_name(backend->type())));
    return true;
}

void BaseCLI::stop_runtime() {
    if (!sessions) return;

    // Workers blocked in a command return once their session is closed.
    sessions->close_all_sessions();
    tailer.reset();
    poller.reset();
    sessions.reset();
    if (backend) {
        backend->shutdown();
        backend.reset();
    }
    termkeep_log("cli: runtime stopped");
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Sessions",   {"new", "use", "sessions", "exec", "close", "expire"}},
        {"Background", {"bg", "poll", "stop", "ps", "cleanup"}},
        {"Logs",       {"tail", "logs", "more", "untail"}},
        {"General",    {"info", "help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::HEADING << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::ACCENT
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::HEADING) + "termkeep"
                       + rl_esc(theme::color::RESET);
    if (backend) {
        prompt += ":" + rl_esc(theme::color::ACCENT) + backend_type_name(backend->type())
                + rl_esc(theme::color::RESET);
    }
    prompt += "[" + rl_esc(theme::color::GREEN) + current_session
            + rl_esc(theme::color::RESET) + "]> ";
    return prompt;
}

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> words;
    std::istringstream iss(args);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}
