#include "allocation_optimizer.hpp"
#include "upgrade_path.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <set>

static void optimizer_log(const std::string& msg) {
    resmesh_log("optimizer", msg);
}

static constexpr double VALUE_EPS = 1e-9;
static constexpr double UNREACHABLE = -1.0;   // item values are never negative

int priority_weight(RequirementPriority p) {
    switch (p) {
        case RequirementPriority::Required:  return PRIORITY_WEIGHT_REQUIRED;
        case RequirementPriority::Preferred: return PRIORITY_WEIGHT_PREFERRED;
        case RequirementPriority::Optional:  return PRIORITY_WEIGHT_OPTIONAL;
    }
    return PRIORITY_WEIGHT_OPTIONAL;
}

double KnapsackItem::pick_value(size_t k) const {
    if (slot_values.empty()) return value;
    return k >= 1 && k <= slot_values.size() ? slot_values[k - 1] : 0.0;
}

// ── DP ───────────────────────────────────────────────────────

namespace {

// Decisions recorded for one category group, needed to walk back
struct GroupTrace {
    std::vector<size_t> items;                       // indices into the item list, in DP order
    int max_picks = 0;
    std::vector<std::vector<std::vector<bool>>> take; // [item][picks][w]
    std::vector<int> chosen_picks;                   // per w, picks used at the group boundary
};

}  // namespace

std::vector<size_t> solve_knapsack(const std::vector<KnapsackItem>& items,
                                   const std::map<int, int>& caps,
                                   long capacity_units,
                                   std::vector<double>* earned) {
    if (earned) earned->clear();
    if (items.empty() || capacity_units < 0) return {};
    size_t W = static_cast<size_t>(capacity_units);

    std::vector<size_t> order(items.size());
    for (size_t i = 0; i < order.size(); i++) order[i] = i;
    std::sort(order.begin(), order.end(), [&items](size_t x, size_t y) {
        const auto& a = items[x];
        const auto& b = items[y];
        if (a.category_id != b.category_id) return a.category_id < b.category_id;
        if (a.value != b.value) return a.value > b.value;
        if (a.cost != b.cost) return a.cost < b.cost;
        return a.asset_id < b.asset_id;
    });

    std::vector<GroupTrace> groups;
    for (size_t idx : order) {
        if (groups.empty() || items[groups.back().items.front()].category_id != items[idx].category_id) {
            groups.emplace_back();
        }
        groups.back().items.push_back(idx);
    }

    // dp[w] = best value with total weight <= w over the groups processed so far
    std::vector<double> dp(W + 1, 0.0);

    for (auto& group : groups) {
        int category = items[group.items.front()].category_id;
        auto cap_it = caps.find(category);
        int cap = cap_it == caps.end() ? 0 : cap_it->second;
        group.max_picks = std::min(cap, static_cast<int>(group.items.size()));
        group.chosen_picks.assign(W + 1, 0);
        if (group.max_picks <= 0) continue;

        size_t K = static_cast<size_t>(group.max_picks);
        std::vector<std::vector<double>> layer(K + 1, std::vector<double>(W + 1, UNREACHABLE));
        layer[0] = dp;
        group.take.assign(group.items.size(),
                          std::vector<std::vector<bool>>(K + 1, std::vector<bool>(W + 1, false)));

        for (size_t j = 0; j < group.items.size(); j++) {
            const auto& item = items[group.items[j]];
            if (item.weight < 0 || static_cast<size_t>(item.weight) > W) continue;
            size_t wt = static_cast<size_t>(item.weight);
            size_t upper = std::min(K, j + 1);

            for (size_t k = upper; k >= 1; k--) {
                for (size_t w = W + 1; w-- > wt;) {
                    double prev = layer[k - 1][w - wt];
                    if (prev == UNREACHABLE) continue;
                    double candidate = prev + item.pick_value(k);
                    if (candidate > layer[k][w] + VALUE_EPS) {
                        layer[k][w] = candidate;
                        group.take[j][k][w] = true;
                    }
                }
            }
        }

        // Collapse the pick count at the group boundary; fewer picks win ties
        for (size_t w = 0; w <= W; w++) {
            double best = layer[0][w];
            int best_k = 0;
            for (size_t k = 1; k <= K; k++) {
                if (layer[k][w] > best + VALUE_EPS) {
                    best = layer[k][w];
                    best_k = static_cast<int>(k);
                }
            }
            dp[w] = best;
            group.chosen_picks[w] = best_k;
        }
    }

    double best = dp[W];
    size_t w = 0;
    while (w < W && dp[w] + VALUE_EPS < best) w++;

    std::vector<size_t> chosen;
    for (auto g = groups.rbegin(); g != groups.rend(); ++g) {
        if (g->max_picks <= 0) continue;
        size_t k = static_cast<size_t>(g->chosen_picks[w]);
        for (size_t j = g->items.size(); j-- > 0 && k > 0;) {
            if (!g->take[j][k][w]) continue;
            chosen.push_back(g->items[j]);
            if (earned) earned->push_back(items[g->items[j]].pick_value(k));
            w -= static_cast<size_t>(items[g->items[j]].weight);
            k--;
        }
    }
    return chosen;
}

// ── Project selection ────────────────────────────────────────

static bool held_by_project(int asset_id, int project_id, const std::vector<Allocation>& allocations) {
    for (const auto& al : allocations) {
        if (al.asset_id == asset_id && al.is_open() && al.project_id && *al.project_id == project_id) {
            return true;
        }
    }
    return false;
}

static std::vector<UnmetSlot> find_unmet(const std::vector<Requirement>& requirements,
                                         const std::vector<AssetCategory>& categories,
                                         const std::vector<Asset>& assets,
                                         const std::vector<Asset>& selected) {
    std::vector<Requirement> ordered = requirements;
    std::sort(ordered.begin(), ordered.end(), [](const Requirement& a, const Requirement& b) {
        int wa = priority_weight(a.priority), wb = priority_weight(b.priority);
        if (wa != wb) return wa > wb;
        return a.id < b.id;
    });

    std::set<int> used;
    std::vector<UnmetSlot> unmet;
    for (const auto& req : ordered) {
        int filled = 0;
        for (const auto& a : selected) {
            if (filled >= req.quantity_needed) break;
            if (a.category_id != req.category_id || used.count(a.id)) continue;
            if (!meets_spec(a.specification, req.min_spec)) continue;
            used.insert(a.id);
            filled++;
        }
        if (filled >= req.quantity_needed) continue;

        UnmetSlot slot;
        slot.requirement_id = req.id;
        slot.category_id = req.category_id;
        slot.missing = req.quantity_needed - filled;
        for (const auto& c : categories) {
            if (c.id == req.category_id) slot.category_name = c.name;
        }
        if (!req.min_spec.empty()) {
            std::vector<Asset> category_assets;
            for (const auto& a : assets) {
                if (a.category_id == req.category_id) category_assets.push_back(a);
            }
            slot.upgrade_path = suggest_upgrade(category_assets, req.min_spec);
        }
        unmet.push_back(slot);
    }
    return unmet;
}

OptimizationResult optimize_allocation(const Project& project,
                                       const std::vector<Requirement>& requirements,
                                       const std::vector<AssetCategory>& categories,
                                       const std::vector<Asset>& assets,
                                       const std::vector<Allocation>& allocations,
                                       const OptimizerConfig& config) {
    OptimizationResult result;

    // One slot per unit of quantity; a category's picks fill its slots by
    // priority weight desc, then requirement id
    std::map<int, std::vector<const Requirement*>> slots;
    for (const auto& req : requirements) {
        for (int i = 0; i < req.quantity_needed; i++) slots[req.category_id].push_back(&req);
        result.max_value += priority_weight(req.priority) * static_cast<double>(req.quantity_needed);
    }
    std::map<int, int> caps;
    for (auto& [category, list] : slots) {
        std::stable_sort(list.begin(), list.end(), [](const Requirement* a, const Requirement* b) {
            int wa = priority_weight(a->priority), wb = priority_weight(b->priority);
            if (wa != wb) return wa > wb;
            return a->id < b->id;
        });
        caps[category] = static_cast<int>(list.size());
    }

    result.capacity = config.budget_days > 0 ? project.budget / config.budget_days : 0.0;
    while (result.capacity / static_cast<double>(result.step) > config.max_steps) {
        result.step *= 10;
    }

    if (requirements.empty()) {
        result.coverage_score = 1.0;
        return result;
    }

    std::vector<KnapsackItem> items;
    std::map<int, const Asset*> by_id;
    for (const auto& a : assets) {
        by_id[a.id] = &a;
        if (!caps.count(a.category_id)) continue;
        bool usable = a.status == AssetStatus::Available ||
                      (a.status == AssetStatus::InUse && held_by_project(a.id, project.id, allocations));
        if (!usable) continue;

        KnapsackItem item;
        for (const Requirement* req : slots[a.category_id]) {
            double v = priority_weight(req->priority) * spec_match(a.specification, req->min_spec);
            item.slot_values.push_back(v);
            item.value = std::max(item.value, v);
        }
        if (item.value <= 0.0) continue;

        item.asset_id = a.id;
        item.category_id = a.category_id;
        item.cost = a.cost_per_day;
        item.weight = static_cast<long>(std::ceil(a.cost_per_day / static_cast<double>(result.step) - VALUE_EPS));
        if (item.weight < 0) item.weight = 0;
        items.push_back(item);
    }
    result.candidates = static_cast<int>(items.size());

    std::vector<Asset> selected;
    if (result.capacity > 0.0) {
        long units = static_cast<long>(std::floor(result.capacity / static_cast<double>(result.step) + VALUE_EPS));
        std::vector<double> earned;
        auto chosen = solve_knapsack(items, caps, units, &earned);
        for (size_t i = 0; i < chosen.size(); i++) {
            result.achieved_value += earned[i];
            result.selected_asset_ids.push_back(items[chosen[i]].asset_id);
        }
    }

    std::sort(result.selected_asset_ids.begin(), result.selected_asset_ids.end());
    for (int id : result.selected_asset_ids) {
        const Asset* a = by_id[id];
        selected.push_back(*a);
        result.total_cost_per_day += a->cost_per_day;
    }
    result.selected_assets = selected;

    if (result.max_value > 0.0) {
        result.coverage_score = std::min(1.0, std::max(0.0, result.achieved_value / result.max_value));
    }
    result.unmet = find_unmet(requirements, categories, assets, selected);

    optimizer_log(fmt::format("project={} capacity={:.2f} step={} items={} selected={} value={:.2f}/{:.2f}",
                              project.id, result.capacity, result.step, items.size(),
                              result.selected_asset_ids.size(), result.achieved_value, result.max_value));
    return result;
}
