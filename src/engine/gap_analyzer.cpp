#include "gap_analyzer.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

static void gap_log(const std::string& msg) {
    resmesh_log("gap", msg);
}

// (category id, count), sorted by category id
using CategoryCounts = std::vector<std::pair<int, int>>;

static CategoryCounts count_needed(const std::vector<Requirement>& demand) {
    std::map<int, int> needed;
    for (const auto& r : demand) needed[r.category_id] += r.quantity_needed;
    return CategoryCounts(needed.begin(), needed.end());
}

static CategoryCounts count_supply(const std::vector<Asset>& assets) {
    std::map<int, int> available;
    for (const auto& a : assets) {
        if (a.status == AssetStatus::Available || a.status == AssetStatus::InUse) {
            available[a.category_id]++;
        }
    }
    return CategoryCounts(available.begin(), available.end());
}

GapReport analyze_gaps(const std::vector<AssetCategory>& categories,
                       const std::vector<Requirement>& demand,
                       const std::vector<Asset>& assets) {
    std::map<int, std::string> names;
    for (const auto& c : categories) names[c.id] = c.name;

    CategoryCounts needed = count_needed(demand);
    CategoryCounts supply = count_supply(assets);

    GapReport report;
    auto classify = [&](int category, int need, int have) {
        GapEntry e;
        e.category_id = category;
        e.category_name = names.count(category) ? names[category] : fmt::format("category {}", category);
        e.needed = need;
        e.available = have;

        report.total_required += need;
        report.total_available += have;
        report.total_matched += std::min(need, have);

        if (need > have) {
            e.shortage = need - have;
            report.unmet.push_back(e);
        } else if (need > 0) {
            e.surplus = have - need;
            report.met.push_back(e);
        } else if (have > 0) {
            e.surplus = have;
            report.over_provisioned.push_back(e);
        }
    };

    // Two-pointer merge over the id-sorted aggregates
    size_t i = 0, j = 0;
    while (i < needed.size() || j < supply.size()) {
        if (j == supply.size() || (i < needed.size() && needed[i].first < supply[j].first)) {
            classify(needed[i].first, needed[i].second, 0);
            i++;
        } else if (i == needed.size() || supply[j].first < needed[i].first) {
            classify(supply[j].first, 0, supply[j].second);
            j++;
        } else {
            classify(needed[i].first, needed[i].second, supply[j].second);
            i++;
            j++;
        }
    }

    report.gap_score = report.total_required > 0
        ? static_cast<double>(report.total_matched) / report.total_required
        : 1.0;

    gap_log(fmt::format("required={} matched={} available={} unmet={} score={:.3f}",
                        report.total_required, report.total_matched, report.total_available,
                        report.unmet.size(), report.gap_score));
    return report;
}
