#include "snapshot.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>

template <typename T>
static void sort_by_id(std::vector<T>& items) {
    std::sort(items.begin(), items.end(),
              [](const T& a, const T& b) { return a.id < b.id; });
}

// Binary search over an id-sorted table
template <typename T>
static const T* lookup(const std::vector<T>& items, int id) {
    auto it = std::lower_bound(items.begin(), items.end(), id,
                               [](const T& item, int key) { return item.id < key; });
    if (it == items.end() || it->id != id) return nullptr;
    return &*it;
}

template <typename T>
static Result<void> check_unique_ids(const std::vector<T>& items, const char* table) {
    std::set<int> seen;
    for (const auto& item : items) {
        if (!seen.insert(item.id).second) {
            return Result<void>::Err(fmt::format("{}: duplicate id {}", table, item.id), ErrorCode::Parse);
        }
    }
    return Result<void>::Ok();
}

Result<void> validate_snapshot(const SnapshotData& data) {
    Result<void> r = Result<void>::Ok();
    if ((r = check_unique_ids(data.categories, "categories")).is_err()) return r;
    if ((r = check_unique_ids(data.teams, "teams")).is_err()) return r;
    if ((r = check_unique_ids(data.projects, "projects")).is_err()) return r;
    if ((r = check_unique_ids(data.requirements, "requirements")).is_err()) return r;
    if ((r = check_unique_ids(data.assets, "assets")).is_err()) return r;
    if ((r = check_unique_ids(data.allocations, "allocations")).is_err()) return r;
    if ((r = check_unique_ids(data.usage_logs, "usage_logs")).is_err()) return r;

    std::set<int> categories, teams, projects, assets;
    for (const auto& c : data.categories) categories.insert(c.id);
    for (const auto& t : data.teams) teams.insert(t.id);
    for (const auto& p : data.projects) projects.insert(p.id);
    for (const auto& a : data.assets) assets.insert(a.id);

    auto err = [](const std::string& msg) {
        return Result<void>::Err(msg, ErrorCode::Parse);
    };

    for (const auto& t : data.teams) {
        if (t.budget < 0.0)
            return err(fmt::format("team {}: budget must not be negative", t.id));
    }
    for (const auto& p : data.projects) {
        if (p.team_id != 0 && !teams.count(p.team_id))
            return err(fmt::format("project {}: unknown team {}", p.id, p.team_id));
        if (p.budget < 0.0)
            return err(fmt::format("project {}: budget must not be negative", p.id));
    }
    for (const auto& req : data.requirements) {
        if (!projects.count(req.project_id))
            return err(fmt::format("requirement {}: unknown project {}", req.id, req.project_id));
        if (!categories.count(req.category_id))
            return err(fmt::format("requirement {}: unknown category {}", req.id, req.category_id));
        if (req.quantity_needed < 1)
            return err(fmt::format("requirement {}: quantity_needed must be >= 1", req.id));
    }
    for (const auto& a : data.assets) {
        if (!categories.count(a.category_id))
            return err(fmt::format("asset {}: unknown category {}", a.id, a.category_id));
        if (a.current_team_id && !teams.count(*a.current_team_id))
            return err(fmt::format("asset {}: unknown team {}", a.id, *a.current_team_id));
        if (a.cost_per_day < 0.0 || a.cost_per_hour < 0.0)
            return err(fmt::format("asset {}: costs must not be negative", a.id));
        if (a.total_hours_used < 0.0)
            return err(fmt::format("asset {}: total_hours_used must not be negative", a.id));
    }

    std::map<int, int> open_allocation;   // asset -> allocation id
    for (const auto& al : data.allocations) {
        if (!assets.count(al.asset_id))
            return err(fmt::format("allocation {}: unknown asset {}", al.id, al.asset_id));
        if (!teams.count(al.team_id))
            return err(fmt::format("allocation {}: unknown team {}", al.id, al.team_id));
        if (al.project_id && !projects.count(*al.project_id))
            return err(fmt::format("allocation {}: unknown project {}", al.id, *al.project_id));
        if (al.actual_hours_used < 0.0)
            return err(fmt::format("allocation {}: actual_hours_used must not be negative", al.id));
        if (al.is_open()) {
            auto [it, inserted] = open_allocation.emplace(al.asset_id, al.id);
            if (!inserted)
                return err(fmt::format("asset {} has two active allocations ({} and {})",
                                       al.asset_id, it->second, al.id));
        }
    }
    for (const auto& a : data.assets) {
        bool in_use = a.status == AssetStatus::InUse;
        bool has_open = open_allocation.count(a.id) > 0;
        if (in_use != has_open)
            return err(fmt::format("asset {}: status '{}' disagrees with its allocations",
                                   a.id, to_string(a.status)));
    }

    for (const auto& log : data.usage_logs) {
        if (!assets.count(log.asset_id))
            return err(fmt::format("usage log {}: unknown asset {}", log.id, log.asset_id));
        if (log.team_id != 0 && !teams.count(log.team_id))
            return err(fmt::format("usage log {}: unknown team {}", log.id, log.team_id));
        if (log.project_id && !projects.count(*log.project_id))
            return err(fmt::format("usage log {}: unknown project {}", log.id, *log.project_id));
        if (log.hours_used < 0.0)
            return err(fmt::format("usage log {}: hours_used must not be negative", log.id));
    }

    return Result<void>::Ok();
}

Snapshot::Snapshot(SnapshotData data) : data_(std::move(data)) {
    sort_by_id(data_.categories);
    sort_by_id(data_.teams);
    sort_by_id(data_.projects);
    sort_by_id(data_.requirements);
    sort_by_id(data_.assets);
    sort_by_id(data_.allocations);
    std::sort(data_.usage_logs.begin(), data_.usage_logs.end(),
              [](const UsageLog& a, const UsageLog& b) {
                  if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
                  return a.id < b.id;
              });
}

std::vector<Asset> Snapshot::list_assets(const AssetFilter& filter) const {
    std::vector<Asset> out;
    for (const auto& a : data_.assets) {
        if (filter.category_id && a.category_id != *filter.category_id) continue;
        if (!filter.statuses.empty() &&
            std::find(filter.statuses.begin(), filter.statuses.end(), a.status) == filter.statuses.end()) {
            continue;
        }
        out.push_back(a);
    }
    return out;
}

std::vector<Requirement> Snapshot::list_requirements(const std::vector<ProjectStatus>& statuses) const {
    std::vector<Requirement> out;
    for (const auto& req : data_.requirements) {
        const Project* p = find_project(req.project_id);
        if (!p) continue;
        if (std::find(statuses.begin(), statuses.end(), p->status) == statuses.end()) continue;
        out.push_back(req);
    }
    return out;
}

std::vector<Requirement> Snapshot::list_project_requirements(int project_id) const {
    std::vector<Requirement> out;
    for (const auto& req : data_.requirements) {
        if (req.project_id == project_id) out.push_back(req);
    }
    return out;
}

std::vector<UsageLog> Snapshot::list_usage_logs(std::time_t from, std::time_t to) const {
    auto first = std::lower_bound(data_.usage_logs.begin(), data_.usage_logs.end(), from,
                                  [](const UsageLog& log, std::time_t t) { return log.timestamp < t; });
    std::vector<UsageLog> out;
    for (auto it = first; it != data_.usage_logs.end() && it->timestamp < to; ++it) {
        out.push_back(*it);
    }
    return out;
}

const Asset* Snapshot::find_asset(int id) const {
    return lookup(data_.assets, id);
}

const Project* Snapshot::find_project(int id) const {
    return lookup(data_.projects, id);
}

const AssetCategory* Snapshot::find_category(int id) const {
    return lookup(data_.categories, id);
}

const Team* Snapshot::find_team(int id) const {
    return lookup(data_.teams, id);
}
