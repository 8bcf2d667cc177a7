#include "demand_ranker.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

static void demand_log(const std::string& msg) {
    resmesh_log("demand", msg);
}

// ── Graph construction ───────────────────────────────────────

DemandGraph DemandGraph::build(const std::vector<Asset>& assets,
                               const std::vector<Allocation>& allocations,
                               ConsumerKey key) {
    DemandGraph g;

    for (const auto& a : assets) g.asset_ids_.push_back(a.id);
    std::sort(g.asset_ids_.begin(), g.asset_ids_.end());

    std::map<int, int> asset_index;
    for (size_t i = 0; i < g.asset_ids_.size(); i++) {
        asset_index[g.asset_ids_[i]] = static_cast<int>(i);
    }

    // Consumer key: (team, project) with project = -1 when keyed by team only
    auto consumer_of = [key](const Allocation& al) {
        int project = -1;
        if (key == ConsumerKey::TeamProject && al.project_id) project = *al.project_id;
        return std::make_pair(al.team_id, project);
    };

    std::map<std::pair<int, int>, double> activity;
    for (const auto& al : allocations) {
        if (!asset_index.count(al.asset_id)) continue;
        activity[consumer_of(al)] += std::max(al.actual_hours_used, 1.0);
    }

    std::map<std::pair<int, int>, int> consumer_index;
    int next = static_cast<int>(g.asset_ids_.size());
    for (const auto& [consumer, hours] : activity) {
        (void)hours;
        consumer_index[consumer] = next++;
    }

    // Accumulate raw weights in both directions
    std::vector<std::map<int, double>> weights(static_cast<size_t>(next));
    for (const auto& al : allocations) {
        auto ai = asset_index.find(al.asset_id);
        if (ai == asset_index.end()) continue;
        auto consumer = consumer_of(al);
        int c = consumer_index[consumer];
        double w = activity[consumer];
        weights[static_cast<size_t>(c)][ai->second] += w;
        weights[static_cast<size_t>(ai->second)][c] += w;
    }

    g.out_.resize(static_cast<size_t>(next));
    for (size_t u = 0; u < weights.size(); u++) {
        double total = 0.0;
        for (const auto& [v, w] : weights[u]) total += w;
        if (total <= 0.0) continue;
        for (const auto& [v, w] : weights[u]) {
            g.out_[u].push_back({v, w / total});
        }
    }
    return g;
}

int DemandGraph::edge_count() const {
    int n = 0;
    for (const auto& edges : out_) n += static_cast<int>(edges.size());
    return n;
}

std::vector<double> DemandGraph::step(const std::vector<double>& scores, double damping) const {
    size_t n = out_.size();
    std::vector<double> next(n, (1.0 - damping) / static_cast<double>(n));
    for (size_t u = 0; u < n; u++) {
        double share = damping * scores[u];
        for (const auto& e : out_[u]) {
            next[static_cast<size_t>(e.target)] += share * e.prob;
        }
    }
    return next;
}

// ── Ranking ──────────────────────────────────────────────────

std::vector<Allocation> filter_lookback(const std::vector<Allocation>& allocations,
                                        std::time_t as_of, int lookback_days) {
    if (lookback_days <= 0) return allocations;

    std::time_t cutoff = as_of - static_cast<std::time_t>(lookback_days) * SECONDS_PER_DAY;
    std::vector<Allocation> out;
    for (const auto& al : allocations) {
        bool in_window = al.is_open() ||
                         al.allocated_at >= cutoff ||
                         (al.released_at && *al.released_at >= cutoff);
        if (in_window) out.push_back(al);
    }
    return out;
}

DemandResult rank_demand(const std::vector<Asset>& assets,
                         const std::vector<Allocation>& allocations,
                         const DemandConfig& config) {
    DemandResult result;
    if (assets.empty()) return result;

    DemandGraph graph = DemandGraph::build(assets, allocations, config.consumer_key);
    size_t n = static_cast<size_t>(graph.node_count());
    result.node_count = graph.node_count();
    result.edge_count = graph.edge_count();

    std::vector<double> scores(n, 1.0 / static_cast<double>(n));
    result.converged = false;
    for (int it = 1; it <= config.max_iterations; it++) {
        std::vector<double> next = graph.step(scores, config.damping);
        double delta = 0.0;
        for (size_t i = 0; i < n; i++) delta += std::fabs(next[i] - scores[i]);
        scores = std::move(next);
        result.iterations = it;
        if (delta < config.epsilon) {
            result.converged = true;
            break;
        }
    }

    demand_log(fmt::format("nodes={} edges={} iterations={} converged={}",
                           result.node_count, result.edge_count,
                           result.iterations, result.converged));

    // Asset scores only; consumers are internal
    size_t asset_count = static_cast<size_t>(graph.asset_count());
    double lo = scores[0], hi = scores[0];
    for (size_t i = 0; i < asset_count; i++) {
        lo = std::min(lo, scores[i]);
        hi = std::max(hi, scores[i]);
    }
    bool flat = (hi - lo) <= 1e-15;

    std::map<int, const Asset*> by_id;
    for (const auto& a : assets) by_id[a.id] = &a;

    for (size_t i = 0; i < asset_count; i++) {
        DemandScore s;
        s.asset_id = graph.asset_ids()[i];
        s.asset_name = by_id[s.asset_id]->name;
        s.raw_score = scores[i];
        s.score = flat ? scores[i] : (scores[i] - lo) / (hi - lo);
        result.scores.push_back(s);
    }

    std::sort(result.scores.begin(), result.scores.end(),
              [](const DemandScore& a, const DemandScore& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.asset_id < b.asset_id;
              });
    return result;
}
