#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <snapshot/snapshot.hpp>
#include <store/asset_store.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Prints a failure and returns false when no snapshot is loaded
    bool require_snapshot();

    // Replace the store with the contents of a snapshot file
    Result<void> open_snapshot(const std::string& path);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Engine settings from config, or the built-in defaults
    EngineConfig engine_config() const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<AssetStore> store;
    std::string snapshot_file;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
