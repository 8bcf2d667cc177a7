#include "asset_store.hpp"
#include <snapshot/snapshot_loader.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

static void store_log(const std::string& msg) {
    resmesh_log("store", msg);
}

AssetStore::AssetStore(SnapshotData data)
    : data_(std::move(data)), revision_(data_.revision) {}

std::shared_ptr<const Snapshot> AssetStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SnapshotData copy = data_;
    copy.revision = revision_;
    return std::make_shared<const Snapshot>(std::move(copy));
}

uint64_t AssetStore::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

Asset* AssetStore::find_asset(int id) {
    for (auto& a : data_.assets) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

int AssetStore::next_allocation_id() const {
    int max_id = 0;
    for (const auto& al : data_.allocations) max_id = std::max(max_id, al.id);
    return max_id + 1;
}

int AssetStore::next_usage_log_id() const {
    int max_id = 0;
    for (const auto& log : data_.usage_logs) max_id = std::max(max_id, log.id);
    return max_id + 1;
}

void AssetStore::touch(std::time_t now) {
    ++revision_;
    if (now > data_.as_of) data_.as_of = now;
}

Result<Allocation> AssetStore::allocate(int asset_id, int team_id, std::optional<int> project_id,
                                        uint64_t snapshot_revision, std::time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    Asset* asset = find_asset(asset_id);
    if (!asset) {
        return Result<Allocation>::NotFound(fmt::format("Asset {} not found", asset_id));
    }
    auto team_it = std::find_if(data_.teams.begin(), data_.teams.end(),
                                [team_id](const Team& t) { return t.id == team_id; });
    if (team_it == data_.teams.end()) {
        return Result<Allocation>::NotFound(fmt::format("Team {} not found", team_id));
    }
    if (project_id) {
        auto proj_it = std::find_if(data_.projects.begin(), data_.projects.end(),
                                    [&](const Project& p) { return p.id == *project_id; });
        if (proj_it == data_.projects.end()) {
            return Result<Allocation>::NotFound(fmt::format("Project {} not found", *project_id));
        }
    }

    auto changed = asset_changed_at_.find(asset_id);
    if (changed != asset_changed_at_.end() && changed->second > snapshot_revision) {
        store_log(fmt::format("allocate asset={} rejected: changed at r{} after r{}",
                              asset_id, changed->second, snapshot_revision));
        return Result<Allocation>::Err(
            fmt::format("Asset {} changed since revision {} (now r{})", asset_id, snapshot_revision, revision_),
            ErrorCode::Conflict);
    }
    if (asset->status != AssetStatus::Available) {
        return Result<Allocation>::Err(
            fmt::format("Asset {} is {}, not available", asset_id, to_string(asset->status)),
            ErrorCode::Conflict);
    }
    for (const auto& al : data_.allocations) {
        if (al.asset_id == asset_id && al.is_open()) {
            return Result<Allocation>::Err(
                fmt::format("Asset {} already has an active allocation ({})", asset_id, al.id),
                ErrorCode::Conflict);
        }
    }

    Allocation alloc;
    alloc.id = next_allocation_id();
    alloc.asset_id = asset_id;
    alloc.team_id = team_id;
    alloc.project_id = project_id;
    alloc.allocated_at = now;
    alloc.status = AllocationStatus::Active;

    UsageLog log;
    log.id = next_usage_log_id();
    log.asset_id = asset_id;
    log.team_id = team_id;
    log.project_id = project_id;
    log.action = UsageAction::Allocated;
    log.timestamp = now;

    asset->status = AssetStatus::InUse;
    asset->current_team_id = team_id;
    asset->last_used_at = now;
    data_.allocations.push_back(alloc);
    data_.usage_logs.push_back(log);

    touch(now);
    asset_changed_at_[asset_id] = revision_;
    store_log(fmt::format("allocate asset={} team={} alloc={} r{}", asset_id, team_id, alloc.id, revision_));
    return Result<Allocation>::Ok(alloc);
}

Result<Allocation> AssetStore::release(int allocation_id, double hours_used, std::time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (hours_used < 0.0) {
        return Result<Allocation>::Err("hours_used must be non-negative");
    }

    auto it = std::find_if(data_.allocations.begin(), data_.allocations.end(),
                           [allocation_id](const Allocation& al) { return al.id == allocation_id; });
    if (it == data_.allocations.end()) {
        return Result<Allocation>::NotFound(fmt::format("Allocation {} not found", allocation_id));
    }
    if (!it->is_open()) {
        return Result<Allocation>::Err(fmt::format("Allocation {} is not active", allocation_id),
                                       ErrorCode::Conflict);
    }

    it->status = AllocationStatus::Released;
    it->released_at = now;
    it->actual_hours_used = hours_used;
    Allocation closed = *it;

    Asset* asset = find_asset(closed.asset_id);
    if (asset) {
        asset->status = AssetStatus::Available;
        asset->current_team_id.reset();
        asset->total_hours_used += hours_used;
    }

    UsageLog log;
    log.id = next_usage_log_id();
    log.asset_id = closed.asset_id;
    log.team_id = closed.team_id;
    log.project_id = closed.project_id;
    log.action = UsageAction::Released;
    log.hours_used = hours_used;
    log.timestamp = now;
    data_.usage_logs.push_back(log);

    touch(now);
    asset_changed_at_[closed.asset_id] = revision_;
    store_log(fmt::format("release alloc={} asset={} hours={:.1f} r{}",
                          allocation_id, closed.asset_id, hours_used, revision_));
    return Result<Allocation>::Ok(closed);
}

std::vector<Allocation> AssetStore::active_allocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Allocation> out;
    for (const auto& al : data_.allocations) {
        if (al.is_open()) out.push_back(al);
    }
    return out;
}

Result<void> AssetStore::save(const fs::path& path) const {
    SnapshotData copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = data_;
        copy.revision = revision_;
    }
    auto r = save_snapshot(copy, path);
    if (r.is_ok()) {
        store_log(fmt::format("saved r{} to {}", copy.revision, path.string()));
    }
    return r;
}
