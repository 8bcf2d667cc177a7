#pragma once

#include <vector>
#include <string>
#include <map>
#include <core/types.hpp>

// One candidate asset as the DP sees it
struct KnapsackItem {
    int asset_id = 0;
    int category_id = 0;
    double value = 0.0;    // ordering key: best value over the category's slots
    double cost = 0.0;     // cost_per_day
    long weight = 0;       // cost in capacity steps, rounded up
    // Value earned as the k-th pick of its category (slot_values[k-1]).
    // Empty means every pick earns `value`.
    std::vector<double> slot_values;

    double pick_value(size_t k) const;
};

// A requirement the selection leaves short
struct UnmetSlot {
    int requirement_id = 0;
    int category_id = 0;
    std::string category_name;
    int missing = 0;
    std::vector<int> upgrade_path;   // substitute suggestion toward the requirement's min_spec
};

struct OptimizationResult {
    std::vector<int> selected_asset_ids;     // ascending
    std::vector<Asset> selected_assets;
    double coverage_score = 0.0;             // achieved / max achievable, clamped to [0,1]
    double total_cost_per_day = 0.0;
    double achieved_value = 0.0;
    double max_value = 0.0;
    double capacity = 0.0;                   // daily cost ceiling
    long step = 1;                           // capacity discretization step
    int candidates = 0;
    std::vector<UnmetSlot> unmet;
};

int priority_weight(RequirementPriority p);

// Exact 0/1 knapsack with per-category pick caps.
//
// Items are grouped by category; each group may contribute at most
// caps[category] picks, and the k-th pick of a group earns pick_value(k).
// Returns the chosen item indices (into `items`); when `earned` is given it
// receives the value each chosen item contributed, in the same order.
// Within a group items are tried by value desc, cost asc, id asc and only
// taken on a strict improvement. Reconstruction starts from the smallest
// capacity reaching the optimum, so ties favour the cheaper selection.
std::vector<size_t> solve_knapsack(const std::vector<KnapsackItem>& items,
                                   const std::map<int, int>& caps,
                                   long capacity_units,
                                   std::vector<double>* earned = nullptr);

// Select the asset set that best covers a project's requirements within its
// budget. `assets` and `allocations` are the full snapshot tables.
OptimizationResult optimize_allocation(const Project& project,
                                       const std::vector<Requirement>& requirements,
                                       const std::vector<AssetCategory>& categories,
                                       const std::vector<Asset>& assets,
                                       const std::vector<Allocation>& allocations,
                                       const OptimizerConfig& config);
