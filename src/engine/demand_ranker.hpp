#pragma once

#include <vector>
#include <string>
#include <ctime>
#include <core/types.hpp>

struct DemandScore {
    int asset_id = 0;
    std::string asset_name;
    double score = 0.0;        // min-max normalized to [0,1]
    double raw_score = 0.0;    // stationary score before normalization
};

struct DemandResult {
    std::vector<DemandScore> scores;   // score desc, then asset id asc
    int iterations = 0;
    bool converged = true;             // false = hit the iteration cap, scores approximate
    int node_count = 0;
    int edge_count = 0;
};

// Weighted bipartite graph between assets and synthetic consumer nodes.
// Node indices: assets (ordered by id) first, then consumers (ordered by key).
// Built fresh for each ranking; consumers exist only inside it.
class DemandGraph {
public:
    static DemandGraph build(const std::vector<Asset>& assets,
                             const std::vector<Allocation>& allocations,
                             ConsumerKey key);

    int node_count() const { return static_cast<int>(out_.size()); }
    int asset_count() const { return static_cast<int>(asset_ids_.size()); }
    int edge_count() const;
    const std::vector<int>& asset_ids() const { return asset_ids_; }

    // One power iteration:
    //   next(v) = (1-d)/N + d * sum over u->v of score(u) * P(u,v)
    // Nodes without out-edges pass nothing on.
    std::vector<double> step(const std::vector<double>& scores, double damping) const;

private:
    struct Edge {
        int target;
        double prob;   // row-normalized transition probability
    };

    std::vector<std::vector<Edge>> out_;
    std::vector<int> asset_ids_;
};

// Allocations still open, or allocated/released at or after as_of - lookback_days.
// lookback_days <= 0 keeps everything.
std::vector<Allocation> filter_lookback(const std::vector<Allocation>& allocations,
                                        std::time_t as_of, int lookback_days);

// Rank assets by sustained demand. Iterates until the L1 change drops below
// config.epsilon or config.max_iterations is reached. When every asset ends
// with the same score the raw baseline is returned without normalization.
DemandResult rank_demand(const std::vector<Asset>& assets,
                         const std::vector<Allocation>& allocations,
                         const DemandConfig& config);
