#pragma once

#include <vector>
#include <string>
#include <optional>
#include <ctime>
#include <core/types.hpp>

struct UrgentRequest {
    int category_id = 0;
    int quantity = 1;
    std::optional<double> max_daily_cost;   // absent or <= 0 = no ceiling
    CapabilityMap min_spec;                 // empty = no constraints
};

struct MatchCandidate {
    int asset_id = 0;
    std::string asset_name;
    std::string asset_tag;
    double cost_per_day = 0.0;
    double score = 0.0;             // weighted composite
    double spec_match = 0.0;
    double availability = 0.0;
    double cost_efficiency = 0.0;
    std::vector<std::string> reasons;
};

struct UrgentMatchResult {
    std::vector<MatchCandidate> matches;   // best first, at most `quantity`
    int total_found = 0;                   // eligible candidates before truncation
    std::vector<int> upgrade_path;         // substitute suggestion, empty if not needed
};

// Greedy composite ranking of the available assets in one category.
//
// `category_assets` holds every asset of the requested category, any status;
// `allocations` is the history used for the recency availability signal.
//
// Ordering: composite desc, then cost asc, then id asc. Fewer eligible assets
// than requested is not an error.
UrgentMatchResult match_urgent(const std::vector<Asset>& category_assets,
                               const std::vector<Allocation>& allocations,
                               const UrgentRequest& request,
                               const MatchingConfig& config,
                               std::time_t as_of);
