#include "resmesh_cli.hpp"
#include "theme.hpp"
#include "commands/command_helpers.hpp"
#include <iostream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <readline/readline.h>
#include <readline/history.h>

ResMeshCLI::ResMeshCLI() : BaseCLI() {
    register_all_commands();
}

void ResMeshCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("Bye.") << "\n";
        exit(0);
    }, "Exit ResMesh");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("Bye.") << "\n";
        exit(0);
    }, "Exit ResMesh");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_inventory_commands(*this);
    register_matching_commands(*this);
    register_analytics_commands(*this);
}

bool ResMeshCLI::open_initial(const std::optional<std::string>& snapshot_path, bool quiet_if_missing) {
    std::string path;
    if (snapshot_path) {
        path = *snapshot_path;
    } else {
        path = config ? config->snapshot_path() : DEFAULT_SNAPSHOT_FILE;
        // The configured default is optional; an explicit path is not
        if (quiet_if_missing && !fs::exists(path)) return false;
    }

    auto r = open_snapshot(path);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return false;
    }
    return true;
}

void ResMeshCLI::run_repl(const std::optional<std::string>& snapshot_path) {
    std::cout << theme::banner();

    if (open_initial(snapshot_path, true)) {
        auto snap = store->snapshot();
        std::cout << theme::ok(fmt::format("{}: {} assets, {} projects",
                                           snapshot_file, snap->list_assets().size(),
                                           snap->list_projects().size()));
    } else if (!store) {
        std::cout << theme::step("No snapshot loaded. Use 'load <file>'.");
    }
    std::cout << theme::dim("    Type 'help' for commands.") << "\n\n";

    resmesh_log("cli", "repl started");

    std::string line;
    while (true) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);
        trim(line);

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

    std::cout << "\n";
    resmesh_log("cli", "repl ended");
}

void ResMeshCLI::run_setup() {
    bool existed = global_config_exists();
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return;
    }

    std::cout << theme::banner();
    std::cout << theme::section("Setup");
    if (existed) {
        std::cout << theme::info("Config already present: " + get_global_config_path().string());
    } else {
        std::cout << theme::ok("Wrote " + get_global_config_path().string());
    }
    std::cout << theme::dim("    Edit it to tune ranking, matching and trend defaults.") << "\n";
    std::cout << theme::dim("    A ./resmesh.yaml next to your snapshot overrides it per directory.") << "\n\n";
}

int ResMeshCLI::run_command(const std::optional<std::string>& snapshot_path,
                            const std::string& command, const std::vector<std::string>& args) {
    if (command != "load" && command != "help") {
        if (!open_initial(snapshot_path, true) && snapshot_path) {
            return 1;
        }
    }
    bool had_store = store != nullptr;
    uint64_t before = had_store ? store->revision() : 0;

    std::string args_str;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) args_str += " ";
        args_str += args[i];
    }
    execute_command(command, args_str);

    // Mutations in one-shot mode persist straight back to the file they came from
    if (had_store && store->revision() != before) {
        auto r = store->save(snapshot_file);
        if (r.is_err()) {
            print_error(r.error, r.code);
            return 1;
        }
    }
    return 0;
}
