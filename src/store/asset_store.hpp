#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <filesystem>
#include <ctime>
#include <core/types.hpp>
#include <snapshot/snapshot.hpp>

namespace fs = std::filesystem;

// Owns the allocation table. The only mutating component: the engine reads
// immutable snapshots taken from here.
//
// allocate/release are serialized. Every successful mutation bumps the
// revision and appends a usage log; allocation records are only ever closed.
class AssetStore {
public:
    explicit AssetStore(SnapshotData data);

    // Immutable copy of the current state, stamped with the current revision
    std::shared_ptr<const Snapshot> snapshot() const;

    uint64_t revision() const;

    // Assign an asset. Fails with Conflict when the asset is not available,
    // already has an active allocation, or its allocation state changed after
    // `snapshot_revision` (the caller decided on stale data).
    Result<Allocation> allocate(int asset_id, int team_id, std::optional<int> project_id,
                                uint64_t snapshot_revision,
                                std::time_t now = std::time(nullptr));

    // Close an active allocation, returning the asset to the pool.
    Result<Allocation> release(int allocation_id, double hours_used,
                               std::time_t now = std::time(nullptr));

    std::vector<Allocation> active_allocations() const;

    Result<void> save(const fs::path& path) const;

private:
    mutable std::mutex mutex_;
    SnapshotData data_;
    uint64_t revision_ = 0;
    std::map<int, uint64_t> asset_changed_at_;   // asset -> revision of last allocate/release

    Asset* find_asset(int id);
    int next_allocation_id() const;
    int next_usage_log_id() const;
    void touch(std::time_t now);
};
