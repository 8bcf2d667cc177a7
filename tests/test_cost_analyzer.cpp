#include <gtest/gtest.h>
#include <engine/cost_analyzer.hpp>

static Asset asset(int id, double per_day, double util, std::optional<int> team,
                   AssetStatus status = AssetStatus::Available) {
    Asset a;
    a.id = id;
    a.name = "asset-" + std::to_string(id);
    a.category_id = 1;
    a.status = team ? AssetStatus::InUse : status;
    a.cost_per_day = per_day;
    a.cost_per_hour = per_day / 24.0;
    a.utilization_rate = util;
    a.total_hours_used = 48;
    a.current_team_id = team;
    return a;
}

static std::vector<Team> teams() {
    return {{1, "Vision", "", 0.0, 0}, {2, "Speech", "", 0.0, 0}, {3, "Idle", "", 0.0, 0}};
}

TEST(CostAnalyzer, TotalsPerTeam) {
    std::vector<Asset> assets = {
        asset(1, 240, 50, 1),
        asset(2, 120, 90, 1),
        asset(3, 480, 10, 2),
        asset(4, 24, 0, std::nullopt),
    };
    auto report = analyze_costs(teams(), assets);

    ASSERT_EQ(report.by_team.size(), 3u);
    EXPECT_EQ(report.by_team[0].team_name, "Speech");
    EXPECT_DOUBLE_EQ(report.by_team[0].daily_cost, 480.0);
    EXPECT_DOUBLE_EQ(report.by_team[0].monthly_cost, 480.0 * COST_MONTH_DAYS);
    EXPECT_DOUBLE_EQ(report.by_team[0].total_spent, 48 * 20.0);

    EXPECT_EQ(report.by_team[1].team_id, 1);
    EXPECT_EQ(report.by_team[1].assets_held, 2);
    EXPECT_DOUBLE_EQ(report.by_team[1].daily_cost, 360.0);

    EXPECT_EQ(report.by_team[2].assets_held, 0);
    EXPECT_DOUBLE_EQ(report.total_daily_cost, 840.0);
}

TEST(CostAnalyzer, WastedSpendRanking) {
    std::vector<Asset> assets = {
        asset(1, 240, 50, 1),                                          // 120 wasted
        asset(2, 120, 90, 1),                                          // 12
        asset(3, 480, 10, 2),                                          // 432
        asset(4, 24, 0, std::nullopt),                                 // 24
        asset(5, 999, 0, std::nullopt, AssetStatus::Retired),          // not live
    };
    auto report = analyze_costs(teams(), assets);

    ASSERT_EQ(report.wasted.size(), 4u);
    EXPECT_EQ(report.wasted[0].asset_id, 3);
    EXPECT_NEAR(report.wasted[0].wasted_per_day, 432.0, 1e-9);
    EXPECT_EQ(report.wasted[1].asset_id, 1);
    EXPECT_EQ(report.wasted[3].asset_id, 2);
    EXPECT_NEAR(report.total_wasted_per_day, 588.0, 1e-9);
}

TEST(CostAnalyzer, KeepsTopTenButTotalsAll) {
    std::vector<Asset> assets;
    for (int i = 1; i <= 15; i++) assets.push_back(asset(i, 10.0 * i, 0, std::nullopt));
    auto report = analyze_costs({}, assets);

    ASSERT_EQ(report.wasted.size(), static_cast<size_t>(COST_WASTED_TOP_N));
    EXPECT_EQ(report.wasted[0].asset_id, 15);
    EXPECT_DOUBLE_EQ(report.total_wasted_per_day, 10.0 * 120);
    EXPECT_TRUE(report.by_team.empty());
}
