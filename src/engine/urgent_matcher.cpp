#include "urgent_matcher.hpp"
#include "upgrade_path.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>

static void match_log(const std::string& msg) {
    resmesh_log("match", msg);
}

// Latest release time per asset
static std::map<int, std::time_t> last_release_times(const std::vector<Allocation>& allocations) {
    std::map<int, std::time_t> last;
    for (const auto& al : allocations) {
        if (!al.released_at) continue;
        auto it = last.find(al.asset_id);
        if (it == last.end() || *al.released_at > it->second) {
            last[al.asset_id] = *al.released_at;
        }
    }
    return last;
}

static double recency_availability(std::optional<std::time_t> released_at, std::time_t as_of,
                                   double half_life_days) {
    if (!released_at) return 0.5;
    double days = static_cast<double>(as_of - *released_at) / SECONDS_PER_DAY;
    if (days < 0.0) days = 0.0;
    return 0.5 + 0.5 * std::pow(2.0, -days / half_life_days);
}

UrgentMatchResult match_urgent(const std::vector<Asset>& category_assets,
                               const std::vector<Allocation>& allocations,
                               const UrgentRequest& request,
                               const MatchingConfig& config,
                               std::time_t as_of) {
    UrgentMatchResult result;
    bool bounded = request.max_daily_cost && *request.max_daily_cost > 0.0;
    bool constrained = !request.min_spec.empty();

    std::vector<const Asset*> eligible;
    for (const auto& a : category_assets) {
        if (a.category_id != request.category_id) continue;
        if (a.status != AssetStatus::Available) continue;
        if (bounded && a.cost_per_day > *request.max_daily_cost) continue;
        eligible.push_back(&a);
    }
    result.total_found = static_cast<int>(eligible.size());

    double max_cost = 0.0;
    double min_cost = 0.0;
    for (size_t i = 0; i < eligible.size(); i++) {
        max_cost = i == 0 ? eligible[i]->cost_per_day : std::max(max_cost, eligible[i]->cost_per_day);
        min_cost = i == 0 ? eligible[i]->cost_per_day : std::min(min_cost, eligible[i]->cost_per_day);
    }
    // A non-positive ceiling leaves nothing to scale by
    bool uniform_cost = max_cost <= 0.0 || max_cost == min_cost;

    std::map<int, std::time_t> released;
    if (config.availability_mode == AvailabilityMode::Recency) {
        released = last_release_times(allocations);
    }

    std::vector<MatchCandidate> ranked;
    for (const Asset* a : eligible) {
        MatchCandidate c;
        c.asset_id = a->id;
        c.asset_name = a->name;
        c.asset_tag = a->asset_tag;
        c.cost_per_day = a->cost_per_day;
        c.spec_match = spec_match(a->specification, request.min_spec);

        if (config.availability_mode == AvailabilityMode::Recency) {
            auto it = released.find(a->id);
            std::optional<std::time_t> when;
            if (it != released.end()) when = it->second;
            c.availability = recency_availability(when, as_of, config.recency_half_life_days);
        } else {
            c.availability = 1.0;
        }

        c.cost_efficiency = uniform_cost ? 1.0 : std::clamp(1.0 - a->cost_per_day / max_cost, 0.0, 1.0);
        c.score = config.spec_weight * c.spec_match +
                  config.availability_weight * c.availability +
                  config.cost_weight * c.cost_efficiency;
        ranked.push_back(c);
    }

    std::sort(ranked.begin(), ranked.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.cost_per_day != b.cost_per_day) return a.cost_per_day < b.cost_per_day;
        return a.asset_id < b.asset_id;
    });

    size_t take = std::min(ranked.size(), static_cast<size_t>(std::max(request.quantity, 0)));
    result.matches.assign(ranked.begin(), ranked.begin() + static_cast<long>(take));

    // Reasons compare against the best sub-scores within the returned set
    if (!result.matches.empty()) {
        double best_spec = 0.0, best_avail = 0.0;
        double cheapest = result.matches.front().cost_per_day;
        for (const auto& m : result.matches) {
            best_spec = std::max(best_spec, m.spec_match);
            best_avail = std::max(best_avail, m.availability);
            cheapest = std::min(cheapest, m.cost_per_day);
        }
        for (auto& m : result.matches) {
            if (constrained && m.spec_match == best_spec) m.reasons.push_back("best spec match");
            if (constrained && m.spec_match >= 1.0) m.reasons.push_back("meets all spec requirements");
            if (m.cost_per_day == cheapest) m.reasons.push_back("lowest cost");
            if (config.availability_mode == AvailabilityMode::Recency &&
                m.availability > 0.5 && m.availability == best_avail) {
                m.reasons.push_back("recently freed");
            }
        }
    }

    // Substitute suggestion when nothing meets the constraints exactly
    if (constrained) {
        bool exact = std::any_of(ranked.begin(), ranked.end(),
                                 [](const MatchCandidate& c) { return c.spec_match >= 1.0; });
        if (!exact) {
            std::optional<int> from;
            if (!result.matches.empty()) from = result.matches.front().asset_id;
            result.upgrade_path = suggest_upgrade(category_assets, request.min_spec, from);
        }
    }

    match_log(fmt::format("category={} qty={} eligible={} returned={} upgrade_hops={}",
                          request.category_id, request.quantity, result.total_found,
                          result.matches.size(),
                          result.upgrade_path.empty() ? 0 : result.upgrade_path.size() - 1));
    return result;
}
