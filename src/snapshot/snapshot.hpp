#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ctime>
#include <cstdint>
#include <core/types.hpp>

// Filter for SnapshotReader::list_assets. Unset fields match everything.
struct AssetFilter {
    std::optional<int> category_id;
    std::vector<AssetStatus> statuses;   // empty = any status
};

// Read-only, point-in-time query surface consumed by the engine.
// Implementations must be safe for concurrent const access.
class SnapshotReader {
public:
    virtual ~SnapshotReader() = default;

    // Point in time the snapshot describes, and the store revision it was read at
    virtual std::time_t as_of() const = 0;
    virtual uint64_t revision() const = 0;

    // Assets ordered by id
    virtual std::vector<Asset> list_assets(const AssetFilter& filter = {}) const = 0;
    virtual std::vector<AssetCategory> list_categories() const = 0;
    virtual std::vector<Team> list_teams() const = 0;
    virtual std::vector<Project> list_projects() const = 0;

    // Requirements of projects whose status is in `statuses`
    virtual std::vector<Requirement> list_requirements(const std::vector<ProjectStatus>& statuses) const = 0;
    virtual std::vector<Requirement> list_project_requirements(int project_id) const = 0;

    // Full allocation history, ordered by id
    virtual std::vector<Allocation> list_allocations() const = 0;

    // Usage logs with from <= timestamp < to, ordered by timestamp then id
    virtual std::vector<UsageLog> list_usage_logs(std::time_t from, std::time_t to) const = 0;

    virtual const Asset* find_asset(int id) const = 0;
    virtual const Project* find_project(int id) const = 0;
    virtual const AssetCategory* find_category(int id) const = 0;
    virtual const Team* find_team(int id) const = 0;
};

// Plain entity tables, as loaded from a snapshot file or produced by the store
struct SnapshotData {
    std::time_t as_of = 0;
    uint64_t revision = 0;
    std::vector<AssetCategory> categories;
    std::vector<Team> teams;
    std::vector<Project> projects;
    std::vector<Requirement> requirements;
    std::vector<Asset> assets;
    std::vector<Allocation> allocations;
    std::vector<UsageLog> usage_logs;
};

// Check the data model invariants: unique ids, references resolve, at most one
// active allocation per asset, status in_use iff an open allocation exists.
Result<void> validate_snapshot(const SnapshotData& data);

// In-memory SnapshotReader over a SnapshotData. Tables are sorted on construction.
class Snapshot : public SnapshotReader {
public:
    explicit Snapshot(SnapshotData data);

    std::time_t as_of() const override { return data_.as_of; }
    uint64_t revision() const override { return data_.revision; }

    std::vector<Asset> list_assets(const AssetFilter& filter = {}) const override;
    std::vector<AssetCategory> list_categories() const override { return data_.categories; }
    std::vector<Team> list_teams() const override { return data_.teams; }
    std::vector<Project> list_projects() const override { return data_.projects; }

    std::vector<Requirement> list_requirements(const std::vector<ProjectStatus>& statuses) const override;
    std::vector<Requirement> list_project_requirements(int project_id) const override;

    std::vector<Allocation> list_allocations() const override { return data_.allocations; }
    std::vector<UsageLog> list_usage_logs(std::time_t from, std::time_t to) const override;

    const Asset* find_asset(int id) const override;
    const Project* find_project(int id) const override;
    const AssetCategory* find_category(int id) const override;
    const Team* find_team(int id) const override;

    const SnapshotData& data() const { return data_; }

private:
    SnapshotData data_;
};
