#include "base_cli.hpp"
#include "theme.hpp"
#include <snapshot/snapshot_loader.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        set_resmesh_log_path(config->log_file());
    } else {
        std::cout << theme::fail("Config: " + config_result.error);
        std::cout << theme::step("Falling back to built-in defaults.");
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_snapshot() {
    if (!store) {
        std::cout << theme::fail("No snapshot loaded. Run 'load <file>' first.");
        return false;
    }
    return true;
}

Result<void> BaseCLI::open_snapshot(const std::string& path) {
    auto data = load_snapshot(path);
    if (data.is_err()) {
        return Result<void>::Err(data.error, data.code);
    }
    store = std::make_unique<AssetStore>(std::move(data.value));
    snapshot_file = path;
    resmesh_log("cli", fmt::format("opened snapshot {} at r{}", path, store->revision()));
    return Result<void>::Ok();
}

EngineConfig BaseCLI::engine_config() const {
    return config ? config->engine() : EngineConfig{};
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
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Inventory", {"load", "status", "assets", "allocs", "allocate", "release", "save"}},
        {"Matching",  {"match", "optimize", "upgrade"}},
        {"Analytics", {"gap", "demand", "collab", "trend", "costs"}},
        {"General",   {"help", "clear", "quit", "exit"}},
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

        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::INDIGO
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

    if (!store) {
        return rl_esc(theme::color::AMBER) + "resmesh"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::AMBER) + "resmesh"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::INDIGO) + fs::path(snapshot_file).filename().string()
         + rl_esc(theme::color::RESET) + "@"
         + rl_esc(theme::color::GREEN) + fmt::format("r{}", store->revision())
         + rl_esc(theme::color::RESET) + "> ";
}
