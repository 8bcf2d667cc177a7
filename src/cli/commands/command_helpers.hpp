#pragma once

#include "../base_cli.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <snapshot/snapshot.hpp>

// Shared helpers used by the command files (inventory.cpp, matching.cpp, analytics.cpp)

// Whitespace-separated arguments: bare words in order, key=value pairs by key
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    bool has(const std::string& key) const { return options.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const;
};

CommandArgs parse_args(const std::string& arg);

// Strict positive-or-zero integer id; nullopt on anything else
std::optional<int> parse_id(const std::string& text);

// Capability constraints from every option not in `reserved`.
// Returns false (and prints why) on a malformed pair.
bool collect_capabilities(const CommandArgs& args, const std::vector<std::string>& reserved,
                          CapabilityMap& out);

// Report a failed engine/store call
void print_error(const std::string& error, ErrorCode code);

std::string asset_label(const SnapshotReader& snap, int asset_id);
std::string category_label(const SnapshotReader& snap, int category_id);
std::string team_label(const SnapshotReader& snap, int team_id);

// "gpu-01 -> gpu-04 -> gpu-07"
std::string format_path(const SnapshotReader& snap, const std::vector<int>& path);

std::string format_money(double amount);

// Command registration
void register_inventory_commands(BaseCLI& cli);
void register_matching_commands(BaseCLI& cli);
void register_analytics_commands(BaseCLI& cli);
