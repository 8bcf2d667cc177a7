#include "collaboration_grouper.hpp"
#include "disjoint_set.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>

static void collab_log(const std::string& msg) {
    resmesh_log("collab", msg);
}

CollaborationGraph group_collaborations(const std::vector<Asset>& assets,
                                        const std::vector<Allocation>& allocations) {
    CollaborationGraph graph;

    std::vector<const Asset*> sorted;
    for (const auto& a : assets) sorted.push_back(&a);
    std::sort(sorted.begin(), sorted.end(),
              [](const Asset* x, const Asset* y) { return x->id < y->id; });

    std::map<int, size_t> index;
    for (size_t i = 0; i < sorted.size(); i++) index[sorted[i]->id] = i;

    // Group key: (0, project) or (1, team) so the two id spaces never collide
    std::map<std::pair<int, int>, std::set<size_t>> groups;
    for (const auto& al : allocations) {
        auto it = index.find(al.asset_id);
        if (it == index.end()) continue;
        auto key = al.project_id ? std::make_pair(0, *al.project_id) : std::make_pair(1, al.team_id);
        groups[key].insert(it->second);
    }

    DisjointSet dsu(sorted.size());
    std::map<std::pair<size_t, size_t>, int> pair_weight;
    for (const auto& [key, members] : groups) {
        (void)key;
        if (members.size() < 2) continue;
        std::vector<size_t> m(members.begin(), members.end());
        for (size_t i = 0; i < m.size(); i++) {
            dsu.unite(m[0], m[i]);
            for (size_t j = i + 1; j < m.size(); j++) {
                pair_weight[{m[i], m[j]}]++;
            }
        }
    }

    for (const auto& [pair, weight] : pair_weight) {
        graph.edges.push_back({sorted[pair.first]->id, sorted[pair.second]->id, weight});
    }

    // Members per root, ascending ids because indices follow id order
    std::map<size_t, std::vector<size_t>> by_root;
    for (size_t i = 0; i < sorted.size(); i++) by_root[dsu.find(i)].push_back(i);

    std::vector<std::vector<size_t>> clusters;
    for (auto& [root, members] : by_root) {
        (void)root;
        clusters.push_back(std::move(members));
    }
    std::sort(clusters.begin(), clusters.end(),
              [](const std::vector<size_t>& a, const std::vector<size_t>& b) {
                  if (a.size() != b.size()) return a.size() > b.size();
                  return a.front() < b.front();
              });

    std::vector<int> community_of(sorted.size(), 0);
    for (size_t c = 0; c < clusters.size(); c++) {
        Community community;
        community.id = static_cast<int>(c);
        for (size_t i : clusters[c]) {
            community.asset_ids.push_back(sorted[i]->id);
            community_of[i] = static_cast<int>(c);
        }
        graph.communities.push_back(community);
    }

    for (size_t i = 0; i < sorted.size(); i++) {
        CollabNode node;
        node.asset_id = sorted[i]->id;
        node.name = sorted[i]->name;
        node.category_id = sorted[i]->category_id;
        node.community = community_of[i];
        node.community_size = static_cast<int>(clusters[static_cast<size_t>(community_of[i])].size());
        graph.nodes.push_back(node);
    }

    collab_log(fmt::format("assets={} groups={} edges={} communities={}",
                           sorted.size(), groups.size(), graph.edges.size(), graph.communities.size()));
    return graph;
}
