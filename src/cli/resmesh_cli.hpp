#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>
#include <optional>

class ResMeshCLI : public BaseCLI {
public:
    ResMeshCLI();

    // Interactive shell. Opens `snapshot_path`, or the configured default if it exists.
    void run_repl(const std::optional<std::string>& snapshot_path = std::nullopt);
    void run_setup();

    // One-shot: optionally open a snapshot, then run a single command
    int run_command(const std::optional<std::string>& snapshot_path,
                    const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
    bool open_initial(const std::optional<std::string>& snapshot_path, bool quiet_if_missing);
};
