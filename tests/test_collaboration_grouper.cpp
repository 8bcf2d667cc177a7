#include <gtest/gtest.h>
#include <engine/collaboration_grouper.hpp>

static Asset asset(int id) {
    Asset a;
    a.id = id;
    a.name = "asset-" + std::to_string(id);
    a.category_id = id % 2 + 1;
    return a;
}

static Allocation use(int id, int asset_id, int team, std::optional<int> project) {
    Allocation al;
    al.id = id;
    al.asset_id = asset_id;
    al.team_id = team;
    al.project_id = project;
    return al;
}

static std::vector<Asset> seven_assets() {
    std::vector<Asset> out;
    for (int id = 7; id >= 1; id--) out.push_back(asset(id));
    return out;
}

static std::vector<Allocation> history() {
    return {
        use(1, 1, 10, 100), use(2, 2, 10, 100),      // project 100: 1, 2
        use(3, 2, 11, 101), use(4, 3, 11, 101),      // project 101: 2, 3
        use(5, 1, 10, 102), use(6, 2, 12, 102),      // project 102: 1, 2 again
        use(7, 5, 20, std::nullopt),                 // team 20 without project: 5, 6
        use(8, 6, 20, std::nullopt),
        use(9, 4, 21, std::nullopt),                 // team 21 alone: 4
    };
}

TEST(CollaborationGrouper, TransitiveCommunities) {
    auto g = group_collaborations(seven_assets(), history());

    ASSERT_EQ(g.communities.size(), 4u);
    EXPECT_EQ(g.communities[0].asset_ids, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(g.communities[1].asset_ids, (std::vector<int>{5, 6}));
    EXPECT_EQ(g.communities[2].asset_ids, (std::vector<int>{4}));
    EXPECT_EQ(g.communities[3].asset_ids, (std::vector<int>{7}));
}

TEST(CollaborationGrouper, EdgesCountSharedGroups) {
    auto g = group_collaborations(seven_assets(), history());

    ASSERT_EQ(g.edges.size(), 3u);
    EXPECT_EQ(g.edges[0].source, 1);
    EXPECT_EQ(g.edges[0].target, 2);
    EXPECT_EQ(g.edges[0].weight, 2);
    EXPECT_EQ(g.edges[1].source, 2);
    EXPECT_EQ(g.edges[1].target, 3);
    EXPECT_EQ(g.edges[1].weight, 1);
    EXPECT_EQ(g.edges[2].source, 5);
    EXPECT_EQ(g.edges[2].target, 6);
}

TEST(CollaborationGrouper, NodesCarryCommunity) {
    auto g = group_collaborations(seven_assets(), history());

    ASSERT_EQ(g.nodes.size(), 7u);
    EXPECT_EQ(g.nodes[0].asset_id, 1);
    EXPECT_EQ(g.nodes[0].community, 0);
    EXPECT_EQ(g.nodes[0].community_size, 3);
    EXPECT_EQ(g.nodes[2].community, g.nodes[0].community);
    EXPECT_EQ(g.nodes[6].asset_id, 7);
    EXPECT_EQ(g.nodes[6].community_size, 1);
}

TEST(CollaborationGrouper, ProjectAndTeamIdsDoNotCollide) {
    // Project 5 and team 5 are different groups
    std::vector<Allocation> h = {use(1, 1, 9, 5), use(2, 2, 5, std::nullopt)};
    auto g = group_collaborations({asset(1), asset(2)}, h);
    EXPECT_EQ(g.communities.size(), 2u);
    EXPECT_TRUE(g.edges.empty());
}

TEST(CollaborationGrouper, EveryAssetInExactlyOneCommunity) {
    auto g = group_collaborations(seven_assets(), history());
    std::vector<int> seen(8, 0);
    for (const auto& c : g.communities) {
        for (int id : c.asset_ids) seen[static_cast<size_t>(id)]++;
    }
    for (int id = 1; id <= 7; id++) EXPECT_EQ(seen[static_cast<size_t>(id)], 1) << "asset " << id;
}

TEST(CollaborationGrouper, EmptyInputs) {
    auto g = group_collaborations({}, {});
    EXPECT_TRUE(g.nodes.empty());
    EXPECT_TRUE(g.communities.empty());
}
