#include <gtest/gtest.h>
#include <engine/urgent_matcher.hpp>
#include <algorithm>
#include <cmath>

static Asset gpu(int id, double cost, double vram, AssetStatus status = AssetStatus::Available) {
    Asset a;
    a.id = id;
    a.name = "gpu-" + std::to_string(id);
    a.category_id = 1;
    a.status = status;
    a.cost_per_day = cost;
    a.specification = {{"vram_gb", CapabilityValue::of_number(vram)}};
    return a;
}

static UrgentRequest request(int qty, std::optional<double> ceiling = std::nullopt) {
    UrgentRequest r;
    r.category_id = 1;
    r.quantity = qty;
    r.max_daily_cost = ceiling;
    return r;
}

TEST(UrgentMatcher, NeverReturnsAssetsInUse) {
    std::vector<Asset> assets = {
        gpu(1, 300, 80, AssetStatus::InUse),
        gpu(2, 36, 24),
        gpu(3, 36, 24),
    };
    auto result = match_urgent(assets, {}, request(1, 9999), MatchingConfig{}, 0);

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.total_found, 2);
    EXPECT_NE(result.matches[0].asset_id, 1);
    // Equal score and cost: lower id wins
    EXPECT_EQ(result.matches[0].asset_id, 2);
}

TEST(UrgentMatcher, CheaperRanksHigherWithoutSpec) {
    std::vector<Asset> assets = {gpu(1, 200, 80), gpu(2, 50, 24), gpu(3, 100, 40)};
    auto result = match_urgent(assets, {}, request(3), MatchingConfig{}, 0);

    ASSERT_EQ(result.matches.size(), 3u);
    EXPECT_EQ(result.matches[0].asset_id, 2);
    EXPECT_EQ(result.matches[1].asset_id, 3);
    EXPECT_EQ(result.matches[2].asset_id, 1);
    EXPECT_DOUBLE_EQ(result.matches[2].cost_efficiency, 0.0);
    EXPECT_DOUBLE_EQ(result.matches[0].cost_efficiency, 0.75);
    EXPECT_DOUBLE_EQ(result.matches[0].spec_match, 1.0);
}

TEST(UrgentMatcher, ScoresNonIncreasingAndBoundedByQuantity) {
    std::vector<Asset> assets;
    for (int i = 1; i <= 8; i++) assets.push_back(gpu(i, 10.0 * i, 8.0 * (i % 4 + 1)));
    auto req = request(5);
    req.min_spec = {{"vram_gb", CapabilityValue::of_number(24)}};

    auto result = match_urgent(assets, {}, req, MatchingConfig{}, 0);
    ASSERT_EQ(result.matches.size(), 5u);
    EXPECT_EQ(result.total_found, 8);
    for (size_t i = 1; i < result.matches.size(); i++) {
        EXPECT_LE(result.matches[i].score, result.matches[i - 1].score);
    }
}

TEST(UrgentMatcher, CeilingFiltersCandidates) {
    std::vector<Asset> assets = {gpu(1, 50, 24), gpu(2, 100, 40), gpu(3, 200, 80)};

    EXPECT_EQ(match_urgent(assets, {}, request(5, 120), MatchingConfig{}, 0).total_found, 2);
    EXPECT_EQ(match_urgent(assets, {}, request(5, 40), MatchingConfig{}, 0).total_found, 0);
    // Absent or non-positive ceiling means unbounded
    EXPECT_EQ(match_urgent(assets, {}, request(5), MatchingConfig{}, 0).total_found, 3);
    EXPECT_EQ(match_urgent(assets, {}, request(5, 0), MatchingConfig{}, 0).total_found, 3);
}

TEST(UrgentMatcher, RaisingCeilingKeepsCheaperMatches) {
    std::vector<Asset> assets = {gpu(1, 50, 24), gpu(2, 100, 40), gpu(3, 200, 80), gpu(4, 400, 80)};
    auto ids = [](const UrgentMatchResult& r) {
        std::vector<int> out;
        for (const auto& m : r.matches) out.push_back(m.asset_id);
        return out;
    };

    auto low = ids(match_urgent(assets, {}, request(10, 150), MatchingConfig{}, 0));
    auto high = ids(match_urgent(assets, {}, request(10, 500), MatchingConfig{}, 0));
    for (int id : low) {
        EXPECT_NE(std::find(high.begin(), high.end(), id), high.end()) << "asset " << id;
    }
}

TEST(UrgentMatcher, NoCandidatesIsNotAnError) {
    std::vector<Asset> assets = {gpu(1, 50, 24, AssetStatus::Maintenance)};
    auto result = match_urgent(assets, {}, request(1), MatchingConfig{}, 0);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.total_found, 0);
    EXPECT_TRUE(result.upgrade_path.empty());
}

TEST(UrgentMatcher, ReasonsDescribeWinners) {
    std::vector<Asset> assets = {gpu(1, 50, 24), gpu(2, 100, 80)};
    auto req = request(2);
    req.min_spec = {{"vram_gb", CapabilityValue::of_number(40)}};

    auto result = match_urgent(assets, {}, req, MatchingConfig{}, 0);
    ASSERT_EQ(result.matches.size(), 2u);
    // 0.4 * 1 + 0.3 + 0.3 * 0.0 = 0.7 beats 0.4 * 0 + 0.3 + 0.3 * 0.5 = 0.45
    EXPECT_EQ(result.matches[0].asset_id, 2);
    const auto& r0 = result.matches[0].reasons;
    EXPECT_NE(std::find(r0.begin(), r0.end(), "meets all spec requirements"), r0.end());
    const auto& r1 = result.matches[1].reasons;
    EXPECT_NE(std::find(r1.begin(), r1.end(), "lowest cost"), r1.end());
    EXPECT_TRUE(result.upgrade_path.empty());
}

TEST(UrgentMatcher, SuggestsUpgradeWhenNothingMeetsSpec) {
    std::vector<Asset> assets = {
        gpu(1, 36, 24),
        gpu(2, 60, 40),
        gpu(3, 300, 80, AssetStatus::Maintenance),
    };
    auto req = request(1);
    req.min_spec = {{"vram_gb", CapabilityValue::of_number(80)}};

    auto result = match_urgent(assets, {}, req, MatchingConfig{}, 0);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].asset_id, 1);
    EXPECT_EQ(result.upgrade_path, (std::vector<int>{1, 3}));
}

TEST(UrgentMatcher, RecencyFavoursRecentlyFreed) {
    const std::time_t day = SECONDS_PER_DAY;
    std::vector<Asset> assets = {gpu(1, 50, 24), gpu(2, 50, 24), gpu(3, 50, 24)};

    Allocation old_use;
    old_use.id = 1;
    old_use.asset_id = 1;
    old_use.team_id = 1;
    old_use.allocated_at = 1 * day;
    old_use.released_at = 2 * day;
    old_use.status = AllocationStatus::Released;

    Allocation recent = old_use;
    recent.id = 2;
    recent.asset_id = 3;
    recent.released_at = 30 * day;

    MatchingConfig config;
    config.availability_mode = AvailabilityMode::Recency;
    auto result = match_urgent(assets, {old_use, recent}, request(3), config, 30 * day);

    ASSERT_EQ(result.matches.size(), 3u);
    EXPECT_EQ(result.matches[0].asset_id, 3);
    EXPECT_DOUBLE_EQ(result.matches[0].availability, 1.0);
    // Released four weeks ago: four half-lives
    EXPECT_NEAR(result.matches[1].availability, 0.5 + 0.5 / 16.0, 1e-9);
    EXPECT_EQ(result.matches[1].asset_id, 1);
    // Never released
    EXPECT_DOUBLE_EQ(result.matches[2].availability, 0.5);
}

TEST(UrgentMatcher, NonPositiveCostsScoreFinite) {
    std::vector<Asset> assets = {gpu(1, -5, 24), gpu(2, 0, 24)};
    auto result = match_urgent(assets, {}, request(2), MatchingConfig{}, 0);

    ASSERT_EQ(result.matches.size(), 2u);
    for (const auto& m : result.matches) {
        EXPECT_TRUE(std::isfinite(m.score));
        EXPECT_DOUBLE_EQ(m.cost_efficiency, 1.0);
    }
    // Same score: the cheaper one leads
    EXPECT_EQ(result.matches[0].asset_id, 1);
}

TEST(UrgentMatcher, CostEfficiencyStaysInUnitRange) {
    std::vector<Asset> assets = {gpu(1, -5, 24), gpu(2, 10, 24)};
    auto result = match_urgent(assets, {}, request(2), MatchingConfig{}, 0);

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].asset_id, 1);
    EXPECT_DOUBLE_EQ(result.matches[0].cost_efficiency, 1.0);
    EXPECT_DOUBLE_EQ(result.matches[1].cost_efficiency, 0.0);
}
