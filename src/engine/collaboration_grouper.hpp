#pragma once

#include <vector>
#include <string>
#include <core/types.hpp>

struct CollabNode {
    int asset_id = 0;
    std::string name;
    int category_id = 0;
    int community = 0;        // index into CollaborationGraph::communities
    int community_size = 1;
};

// Unordered pair (source < target); weight = number of projects/teams sharing it
struct CollabEdge {
    int source = 0;
    int target = 0;
    int weight = 0;
};

struct Community {
    int id = 0;
    std::vector<int> asset_ids;   // ascending
};

struct CollaborationGraph {
    std::vector<CollabNode> nodes;           // every asset, by id
    std::vector<CollabEdge> edges;           // by (source, target)
    std::vector<Community> communities;      // size desc, then smallest member id
};

// Assets allocated to the same project (or the same team, for allocations
// without a project) end up in the same community. Singletons included.
CollaborationGraph group_collaborations(const std::vector<Asset>& assets,
                                        const std::vector<Allocation>& allocations);
