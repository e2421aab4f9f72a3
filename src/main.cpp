#include <iostream>
#include <vector>
#include <string>
#include "cli/termkeep_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::ACCENT << "    termkeep"
              << theme::color::RESET << theme::color::DIM
              << "                  Start the interactive shell" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    termkeep init"
              << theme::color::RESET << theme::color::DIM
              << "             Write ~/.termkeep/config.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::ACCENT << "    termkeep run "
              << theme::color::RESET << theme::color::HEADING << "<command>"
              << theme::color::RESET << theme::color::DIM
              << "    Run one command, exit with its status" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    termkeep --version        Show version\n"
              << "    termkeep --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        TermkeepCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::HEADING << theme::color::BOLD << "termkeep"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::version() << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init") {
            return cli.run_init();
        } else if (cmd == "run") {
            if (argc < 3) {
                std::cout << theme::fail("Missing command.");
                std::cout << theme::step("Usage: termkeep run <command>");
                return 1;
            }
            std::string command;
            for (int i = 2; i < argc; ++i) {
                if (i > 2) command += ' ';
                command += argv[i];
            }
            return cli.run_once(command);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
