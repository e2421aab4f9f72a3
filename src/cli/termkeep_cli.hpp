#pragma once

#include "base_cli.hpp"
#include <string>

// Command registration, one file per group under commands/
void register_session_commands(BaseCLI& cli);
void register_background_commands(BaseCLI& cli);
void register_tail_commands(BaseCLI& cli);
void register_info_commands(BaseCLI& cli);

class TermkeepCLI : public BaseCLI {
public:
    TermkeepCLI();

    void run_repl();

    // Write the default config file.
    int run_init();

    // Run one command in a fresh session; returns its exit code.
    int run_once(const std::string& command);

private:
    void register_all_commands();
};
