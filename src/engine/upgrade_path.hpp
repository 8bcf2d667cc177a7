#pragma once

#include <vector>
#include <optional>
#include <core/types.hpp>

// What the path should end at: any asset meeting `spec`, or one specific asset.
struct UpgradeTarget {
    std::optional<CapabilityMap> spec;
    std::optional<int> asset_id;
};

// Shortest chain of strict upgrades within one category.
//
// Graph: the non-retired assets in `category_assets` (plus the source, even if
// retired); edge A -> B iff dominates(B, A). BFS visits neighbours in
// ascending id, so among equally short paths the one through lower ids wins.
//
// Returns [source] if the source already qualifies, empty if unreachable.
std::vector<int> find_upgrade_path(const std::vector<Asset>& category_assets,
                                   int source_id, const UpgradeTarget& target);

// Pick a starting point for a substitute suggestion: `preferred` when given,
// otherwise the non-retired asset with the best spec_match against `want`,
// then the cheapest, then the lowest id. Returns the path toward `want`.
std::vector<int> suggest_upgrade(const std::vector<Asset>& category_assets,
                                 const CapabilityMap& want,
                                 std::optional<int> preferred = std::nullopt);
