#pragma once

#include <vector>
#include <string>
#include <core/types.hpp>

struct TeamCost {
    int team_id = 0;
    std::string team_name;
    int assets_held = 0;
    double daily_cost = 0.0;
    double monthly_cost = 0.0;    // daily x 30
    double total_spent = 0.0;     // sum(total_hours_used x cost_per_hour) over held assets
};

struct WastedCost {
    int asset_id = 0;
    std::string name;
    std::string asset_tag;
    int category_id = 0;
    double cost_per_day = 0.0;
    double utilization_rate = 0.0;
    double wasted_per_day = 0.0;  // cost_per_day x (1 - utilization/100)
};

struct CostReport {
    std::vector<TeamCost> by_team;      // daily cost desc, then team id
    std::vector<WastedCost> wasted;     // top 10 by wasted_per_day desc, then asset id
    double total_daily_cost = 0.0;
    double total_wasted_per_day = 0.0;  // across all live assets, not just the top 10
};

CostReport analyze_costs(const std::vector<Team>& teams, const std::vector<Asset>& assets);
