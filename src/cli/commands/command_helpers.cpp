#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

std::string CommandArgs::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

CommandArgs parse_args(const std::string& arg) {
    CommandArgs out;
    std::istringstream iss(arg);
    std::string token;
    while (iss >> token) {
        auto eq = token.find('=');
        if (eq != std::string::npos && eq > 0) {
            out.options[token.substr(0, eq)] = token.substr(eq + 1);
        } else {
            out.positional.push_back(token);
        }
    }
    return out;
}

std::optional<int> parse_id(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int v = safe_stoi(text, -1);
    if (v < 0) return std::nullopt;
    return v;
}

bool collect_capabilities(const CommandArgs& args, const std::vector<std::string>& reserved,
                          CapabilityMap& out) {
    for (const auto& [key, value] : args.options) {
        if (std::find(reserved.begin(), reserved.end(), key) != reserved.end()) continue;
        std::string k;
        CapabilityValue v;
        if (!parse_capability_arg(key + "=" + value, k, v)) {
            std::cout << theme::fail("Bad capability: " + key + "=" + value);
            return false;
        }
        out[k] = v;
    }
    return true;
}

void print_error(const std::string& error, ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:
            std::cout << theme::fail("Not found: " + error);
            break;
        case ErrorCode::Conflict:
            std::cout << theme::fail("Conflict: " + error);
            std::cout << theme::step("Re-run the query against the current snapshot and try again.");
            break;
        default:
            std::cout << theme::fail(error);
            break;
    }
}

std::string asset_label(const SnapshotReader& snap, int asset_id) {
    const Asset* a = snap.find_asset(asset_id);
    if (!a) return fmt::format("#{}", asset_id);
    return fmt::format("{} (#{})", a->name, a->id);
}

std::string category_label(const SnapshotReader& snap, int category_id) {
    const AssetCategory* c = snap.find_category(category_id);
    return c ? c->name : fmt::format("category {}", category_id);
}

std::string team_label(const SnapshotReader& snap, int team_id) {
    const Team* t = snap.find_team(team_id);
    return t ? t->name : fmt::format("team {}", team_id);
}

std::string format_path(const SnapshotReader& snap, const std::vector<int>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) out += " -> ";
        const Asset* a = snap.find_asset(path[i]);
        out += a ? a->name : fmt::format("#{}", path[i]);
    }
    return out;
}

std::string format_money(double amount) {
    return fmt::format("${:.2f}", amount);
}
