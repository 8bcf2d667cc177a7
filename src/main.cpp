#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include "cli/resmesh_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::INDIGO << "    resmesh"
              << theme::color::RESET << theme::color::DIM
              << "                          Open the shell" << theme::color::RESET << "\n";
    std::cout << theme::color::INDIGO << "    resmesh shell "
              << theme::color::RESET << theme::color::AMBER << "[file]"
              << theme::color::RESET << theme::color::DIM
              << "             Open the shell on a snapshot" << theme::color::RESET << "\n";
    std::cout << theme::color::INDIGO << "    resmesh run "
              << theme::color::RESET << theme::color::AMBER << "[-f file] <cmd> [args]"
              << theme::color::RESET << theme::color::DIM
              << " Run one command" << theme::color::RESET << "\n";
    std::cout << theme::color::INDIGO << "    resmesh setup"
              << theme::color::RESET << theme::color::DIM
              << "                    Write ~/.resmesh/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    resmesh --version                Show version\n"
              << "    resmesh --help                   Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::INDIGO << theme::color::BOLD << "resmesh"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << RESMESH_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            }
        }

        ResMeshCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "shell") {
            std::optional<std::string> file;
            if (argc >= 3) file = argv[2];
            cli.run_repl(file);
        } else if (cmd == "setup") {
            cli.run_setup();
        } else if (cmd == "run") {
            int i = 2;
            std::optional<std::string> file;
            if (i + 1 < argc && (std::string(argv[i]) == "-f" || std::string(argv[i]) == "--file")) {
                file = argv[i + 1];
                i += 2;
            }
            if (i >= argc) {
                std::cout << theme::fail("Missing command.");
                std::cout << theme::step("Usage: resmesh run [-f file] <cmd> [args]");
                return 1;
            }
            std::string sub = argv[i++];
            std::vector<std::string> args(argv + i, argv + argc);
            return cli.run_command(file, sub, args);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
