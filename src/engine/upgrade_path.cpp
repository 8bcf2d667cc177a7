#include "upgrade_path.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <deque>

static void upgrade_log(const std::string& msg) {
    resmesh_log("upgrade", msg);
}

static bool reaches_target(const Asset& a, const UpgradeTarget& target) {
    if (target.asset_id) return a.id == *target.asset_id;
    if (target.spec) return meets_spec(a.specification, *target.spec);
    return false;
}

std::vector<int> find_upgrade_path(const std::vector<Asset>& category_assets,
                                   int source_id, const UpgradeTarget& target) {
    std::vector<const Asset*> nodes;
    for (const auto& a : category_assets) {
        if (a.status != AssetStatus::Retired || a.id == source_id) {
            nodes.push_back(&a);
        }
    }
    std::sort(nodes.begin(), nodes.end(),
              [](const Asset* x, const Asset* y) { return x->id < y->id; });

    auto src_it = std::find_if(nodes.begin(), nodes.end(),
                               [source_id](const Asset* a) { return a->id == source_id; });
    if (src_it == nodes.end()) return {};
    size_t src = static_cast<size_t>(src_it - nodes.begin());

    if (reaches_target(*nodes[src], target)) return {source_id};

    // Parent index per node; -1 = unvisited
    std::vector<long> parent(nodes.size(), -1);
    parent[src] = static_cast<long>(src);
    std::deque<size_t> queue{src};

    while (!queue.empty()) {
        size_t u = queue.front();
        queue.pop_front();

        for (size_t v = 0; v < nodes.size(); v++) {
            if (parent[v] != -1) continue;
            if (!dominates(nodes[v]->specification, nodes[u]->specification)) continue;

            parent[v] = static_cast<long>(u);
            if (reaches_target(*nodes[v], target)) {
                std::vector<int> path;
                for (size_t cur = v; cur != src; cur = static_cast<size_t>(parent[cur])) {
                    path.push_back(nodes[cur]->id);
                }
                path.push_back(source_id);
                std::reverse(path.begin(), path.end());
                upgrade_log(fmt::format("path from {} found, {} hops", source_id, path.size() - 1));
                return path;
            }
            queue.push_back(v);
        }
    }

    upgrade_log(fmt::format("no upgrade path from {} ({} candidates)", source_id, nodes.size()));
    return {};
}

std::vector<int> suggest_upgrade(const std::vector<Asset>& category_assets,
                                 const CapabilityMap& want,
                                 std::optional<int> preferred) {
    std::optional<int> source = preferred;
    if (!source) {
        const Asset* best = nullptr;
        double best_match = -1.0;
        for (const auto& a : category_assets) {
            if (a.status == AssetStatus::Retired) continue;
            double m = spec_match(a.specification, want);
            bool better = !best || m > best_match ||
                          (m == best_match && (a.cost_per_day < best->cost_per_day ||
                                               (a.cost_per_day == best->cost_per_day && a.id < best->id)));
            if (better) {
                best = &a;
                best_match = m;
            }
        }
        if (!best) return {};
        source = best->id;
    }

    UpgradeTarget target;
    target.spec = want;
    return find_upgrade_path(category_assets, *source, target);
}
