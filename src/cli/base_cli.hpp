#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <backends/backend.hpp>
#include <session/session_manager.hpp>
#include <polling/output_poller.hpp>
#include <polling/log_tailer.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();

    // Build the backend and the stores on first use.
    bool require_runtime();

    // Close every session, then drop the pollers, the store and the backend.
    void stop_runtime();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::shared_ptr<Backend> backend;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<OutputPoller> poller;     // after `sessions`: destroyed first
    std::unique_ptr<LogTailer> tailer;
    std::string current_session = DEFAULT_SESSION_ID;
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Whitespace-separated words of a command line.
std::vector<std::string> split_args(const std::string& args);
