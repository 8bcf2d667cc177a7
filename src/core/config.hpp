#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.resmesh/config.yaml
    static Result<Config> load_global();

    // Load directory config from ./resmesh.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (directory config overrides global keys).
    // Missing files are not an error: defaults apply.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse a config document (used by the loaders and tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const EngineConfig& engine() const { return engine_; }
    const std::string& snapshot_path() const { return snapshot_path_; }
    const std::string& log_file() const { return log_file_; }
    const fs::path& project_dir() const { return project_dir_; }

public:
    Config() = default;

private:
    EngineConfig engine_;
    std::string snapshot_path_;
    std::string log_file_;
    fs::path project_dir_;

    // Overlay keys present in a YAML document onto this config
    Result<void> apply(const std::string& yaml_text, const std::string& origin);
};

// Helpers to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
