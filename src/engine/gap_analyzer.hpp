#pragma once

#include <vector>
#include <string>
#include <core/types.hpp>

struct GapEntry {
    int category_id = 0;
    std::string category_name;
    int needed = 0;
    int available = 0;
    int shortage = 0;   // needed - available, > 0 only for unmet
    int surplus = 0;    // available - needed, > 0 only for met / over-provisioned
};

struct GapReport {
    std::vector<GapEntry> unmet;              // needed > available
    std::vector<GapEntry> met;                // needed > 0 and available >= needed
    std::vector<GapEntry> over_provisioned;   // nothing needed, assets on hand
    double gap_score = 1.0;                   // sum(min(needed, available)) / sum(needed)
    int total_required = 0;
    int total_matched = 0;
    int total_available = 0;
};

// Join demand (requirements of demand-generating projects) against supply
// (assets that are available or in use) per category. Lists come out in
// category id order.
GapReport analyze_gaps(const std::vector<AssetCategory>& categories,
                       const std::vector<Requirement>& demand,
                       const std::vector<Asset>& assets);
