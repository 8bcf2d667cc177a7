#include <gtest/gtest.h>
#include <engine/gap_analyzer.hpp>

static Requirement need(int id, int category, int qty) {
    Requirement r;
    r.id = id;
    r.project_id = 1;
    r.category_id = category;
    r.quantity_needed = qty;
    return r;
}

static Asset asset(int id, int category, AssetStatus status = AssetStatus::Available) {
    Asset a;
    a.id = id;
    a.category_id = category;
    a.status = status;
    return a;
}

static std::vector<AssetCategory> categories() {
    return {{1, "GPU", "", "", ""}, {2, "Storage", "", "", ""}, {3, "Licenses", "", "", ""}};
}

TEST(GapAnalyzer, ClassifiesEachCategory) {
    std::vector<Requirement> demand = {need(1, 1, 3), need(2, 1, 1), need(3, 2, 1)};
    std::vector<Asset> assets = {
        asset(1, 1), asset(2, 1, AssetStatus::InUse),
        asset(3, 2), asset(4, 2),
        asset(5, 3),
    };

    auto report = analyze_gaps(categories(), demand, assets);

    ASSERT_EQ(report.unmet.size(), 1u);
    EXPECT_EQ(report.unmet[0].category_name, "GPU");
    EXPECT_EQ(report.unmet[0].needed, 4);
    EXPECT_EQ(report.unmet[0].available, 2);
    EXPECT_EQ(report.unmet[0].shortage, 2);

    ASSERT_EQ(report.met.size(), 1u);
    EXPECT_EQ(report.met[0].category_id, 2);
    EXPECT_EQ(report.met[0].surplus, 1);

    ASSERT_EQ(report.over_provisioned.size(), 1u);
    EXPECT_EQ(report.over_provisioned[0].category_id, 3);
    EXPECT_EQ(report.over_provisioned[0].surplus, 1);

    EXPECT_EQ(report.total_required, 5);
    EXPECT_EQ(report.total_matched, 3);
    EXPECT_EQ(report.total_available, 5);
    EXPECT_DOUBLE_EQ(report.gap_score, 3.0 / 5.0);
}

TEST(GapAnalyzer, RetiredAndMaintenanceAreNotSupply) {
    std::vector<Asset> assets = {
        asset(1, 1, AssetStatus::Retired),
        asset(2, 1, AssetStatus::Maintenance),
    };
    auto report = analyze_gaps(categories(), {need(1, 1, 1)}, assets);
    ASSERT_EQ(report.unmet.size(), 1u);
    EXPECT_EQ(report.unmet[0].available, 0);
    EXPECT_DOUBLE_EQ(report.gap_score, 0.0);
}

TEST(GapAnalyzer, NoDemandScoresOne) {
    auto report = analyze_gaps(categories(), {}, {asset(1, 1)});
    EXPECT_DOUBLE_EQ(report.gap_score, 1.0);
    EXPECT_TRUE(report.unmet.empty());
    EXPECT_EQ(report.over_provisioned.size(), 1u);
}

TEST(GapAnalyzer, EmptyEverything) {
    auto report = analyze_gaps({}, {}, {});
    EXPECT_DOUBLE_EQ(report.gap_score, 1.0);
    EXPECT_EQ(report.total_required, 0);
}

TEST(GapAnalyzer, DemandWithoutSupplyOrName) {
    // Category 9 has no name entry and no assets
    auto report = analyze_gaps(categories(), {need(1, 9, 2)}, {});
    ASSERT_EQ(report.unmet.size(), 1u);
    EXPECT_EQ(report.unmet[0].category_name, "category 9");
    EXPECT_EQ(report.unmet[0].shortage, 2);
}

TEST(GapAnalyzer, ListsFollowCategoryOrder) {
    std::vector<Requirement> demand = {need(1, 3, 5), need(2, 1, 5)};
    auto report = analyze_gaps(categories(), demand, {asset(1, 2)});
    ASSERT_EQ(report.unmet.size(), 2u);
    EXPECT_EQ(report.unmet[0].category_id, 1);
    EXPECT_EQ(report.unmet[1].category_id, 3);
}
