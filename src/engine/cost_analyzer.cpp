#include "cost_analyzer.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

CostReport analyze_costs(const std::vector<Team>& teams, const std::vector<Asset>& assets) {
    CostReport report;

    std::map<int, TeamCost> by_team;
    for (const auto& t : teams) {
        TeamCost tc;
        tc.team_id = t.id;
        tc.team_name = t.name;
        by_team[t.id] = tc;
    }

    for (const auto& a : assets) {
        if (a.current_team_id) {
            auto it = by_team.find(*a.current_team_id);
            if (it != by_team.end()) {
                it->second.assets_held++;
                it->second.daily_cost += a.cost_per_day;
                it->second.total_spent += a.total_hours_used * a.cost_per_hour;
            }
        }

        bool live = a.status == AssetStatus::Available || a.status == AssetStatus::InUse;
        if (!live || a.cost_per_day <= 0.0) continue;

        WastedCost w;
        w.asset_id = a.id;
        w.name = a.name;
        w.asset_tag = a.asset_tag;
        w.category_id = a.category_id;
        w.cost_per_day = a.cost_per_day;
        w.utilization_rate = a.utilization_rate;
        w.wasted_per_day = a.cost_per_day * (1.0 - a.utilization_rate / 100.0);
        report.total_wasted_per_day += w.wasted_per_day;
        report.wasted.push_back(w);
    }

    for (auto& [id, tc] : by_team) {
        (void)id;
        tc.monthly_cost = tc.daily_cost * COST_MONTH_DAYS;
        report.total_daily_cost += tc.daily_cost;
        report.by_team.push_back(tc);
    }

    std::sort(report.by_team.begin(), report.by_team.end(), [](const TeamCost& a, const TeamCost& b) {
        if (a.daily_cost != b.daily_cost) return a.daily_cost > b.daily_cost;
        return a.team_id < b.team_id;
    });
    std::sort(report.wasted.begin(), report.wasted.end(), [](const WastedCost& a, const WastedCost& b) {
        if (a.wasted_per_day != b.wasted_per_day) return a.wasted_per_day > b.wasted_per_day;
        return a.asset_id < b.asset_id;
    });
    if (report.wasted.size() > static_cast<size_t>(COST_WASTED_TOP_N)) {
        report.wasted.resize(COST_WASTED_TOP_N);
    }

    resmesh_log("costs", fmt::format("teams={} daily={:.2f} wasted/day={:.2f}",
                                     report.by_team.size(), report.total_daily_cost,
                                     report.total_wasted_per_day));
    return report;
}
