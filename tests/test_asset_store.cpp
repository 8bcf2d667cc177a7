#include <gtest/gtest.h>
#include <store/asset_store.hpp>
#include <snapshot/snapshot_loader.hpp>
#include <filesystem>
#include <thread>
#include <atomic>

namespace fs = std::filesystem;

static SnapshotData make_data() {
    SnapshotData d;
    d.as_of = 1700000000;
    d.revision = 1;
    d.categories = {{1, "GPU", "", "", ""}};
    d.teams = {{10, "Vision", "", 0.0, 0}, {11, "Speech", "", 0.0, 0}};

    Project p;
    p.id = 100;
    p.name = "Detector";
    p.team_id = 10;
    d.projects = {p};

    for (int id = 1; id <= 3; id++) {
        Asset a;
        a.id = id;
        a.name = "gpu-0" + std::to_string(id);
        a.category_id = 1;
        a.cost_per_day = 100.0 * id;
        d.assets.push_back(a);
    }
    d.assets[2].status = AssetStatus::Maintenance;
    return d;
}

TEST(AssetStore, AllocateMarksAssetInUse) {
    AssetStore store(make_data());
    auto r = store.allocate(1, 10, 100, store.revision(), 1700000100);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.asset_id, 1);
    EXPECT_TRUE(r.value.is_open());
    EXPECT_EQ(store.revision(), 2u);

    auto snap = store.snapshot();
    EXPECT_EQ(snap->revision(), 2u);
    const Asset* a = snap->find_asset(1);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->status, AssetStatus::InUse);
    EXPECT_EQ(a->current_team_id, std::optional<int>(10));

    auto logs = snap->list_usage_logs(0, 1800000000);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].action, UsageAction::Allocated);

    // Still a consistent snapshot
    EXPECT_TRUE(validate_snapshot(snap->data()).is_ok());
}

TEST(AssetStore, SecondAllocationConflicts) {
    AssetStore store(make_data());
    ASSERT_TRUE(store.allocate(1, 10, std::nullopt, store.revision()).is_ok());

    auto r = store.allocate(1, 11, std::nullopt, store.revision());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Conflict);
    EXPECT_EQ(store.active_allocations().size(), 1u);
}

TEST(AssetStore, UnavailableAssetConflicts) {
    AssetStore store(make_data());
    auto r = store.allocate(3, 10, std::nullopt, store.revision());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Conflict);
}

TEST(AssetStore, UnknownReferencesAreNotFound) {
    AssetStore store(make_data());
    EXPECT_EQ(store.allocate(99, 10, std::nullopt, 1).code, ErrorCode::NotFound);
    EXPECT_EQ(store.allocate(1, 99, std::nullopt, 1).code, ErrorCode::NotFound);
    EXPECT_EQ(store.allocate(1, 10, 999, 1).code, ErrorCode::NotFound);
    EXPECT_EQ(store.release(42, 1.0).code, ErrorCode::NotFound);
}

TEST(AssetStore, StaleRevisionConflicts) {
    AssetStore store(make_data());
    uint64_t seen = store.revision();

    auto first = store.allocate(1, 10, std::nullopt, seen);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(store.release(first.value.id, 2.0).is_ok());

    // Asset 1 is available again, but the caller decided before it changed
    auto stale = store.allocate(1, 11, std::nullopt, seen);
    ASSERT_TRUE(stale.is_err());
    EXPECT_EQ(stale.code, ErrorCode::Conflict);

    // Untouched assets are fine with the old revision
    EXPECT_TRUE(store.allocate(2, 11, std::nullopt, seen).is_ok());

    // A fresh read succeeds
    EXPECT_TRUE(store.allocate(1, 11, std::nullopt, store.revision()).is_ok());
}

TEST(AssetStore, ReleaseReturnsAssetToPool) {
    AssetStore store(make_data());
    auto alloc = store.allocate(2, 10, std::nullopt, store.revision(), 1700000100);
    ASSERT_TRUE(alloc.is_ok());

    auto r = store.release(alloc.value.id, 12.5, 1700050000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, AllocationStatus::Released);
    EXPECT_EQ(r.value.released_at, std::optional<std::time_t>(1700050000));

    auto snap = store.snapshot();
    const Asset* a = snap->find_asset(2);
    EXPECT_EQ(a->status, AssetStatus::Available);
    EXPECT_FALSE(a->current_team_id.has_value());
    EXPECT_DOUBLE_EQ(a->total_hours_used, 12.5);
    EXPECT_TRUE(store.active_allocations().empty());

    // History is kept
    EXPECT_EQ(snap->list_allocations().size(), 1u);
    auto logs = snap->list_usage_logs(0, 1800000000);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[1].action, UsageAction::Released);
    EXPECT_DOUBLE_EQ(logs[1].hours_used, 12.5);
}

TEST(AssetStore, ReleaseTwiceConflicts) {
    AssetStore store(make_data());
    auto alloc = store.allocate(1, 10, std::nullopt, store.revision());
    ASSERT_TRUE(store.release(alloc.value.id, 1.0).is_ok());

    auto again = store.release(alloc.value.id, 1.0);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.code, ErrorCode::Conflict);
}

TEST(AssetStore, NegativeHoursRejected) {
    AssetStore store(make_data());
    auto alloc = store.allocate(1, 10, std::nullopt, store.revision());
    auto r = store.release(alloc.value.id, -1.0);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::InvalidInput);
    EXPECT_EQ(store.active_allocations().size(), 1u);
}

TEST(AssetStore, SnapshotsAreImmutable) {
    AssetStore store(make_data());
    auto before = store.snapshot();
    ASSERT_TRUE(store.allocate(1, 10, std::nullopt, store.revision()).is_ok());

    EXPECT_EQ(before->find_asset(1)->status, AssetStatus::Available);
    EXPECT_EQ(store.snapshot()->find_asset(1)->status, AssetStatus::InUse);
}

TEST(AssetStore, ConcurrentAllocateHasOneWinner) {
    AssetStore store(make_data());
    uint64_t seen = store.revision();
    std::atomic<int> wins{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&store, &wins, seen, i] {
            auto r = store.allocate(1, i % 2 == 0 ? 10 : 11, std::nullopt, seen);
            if (r.is_ok()) wins++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(store.active_allocations().size(), 1u);
}

TEST(AssetStore, SaveWritesLoadableFile) {
    AssetStore store(make_data());
    ASSERT_TRUE(store.allocate(1, 10, 100, store.revision()).is_ok());

    fs::path file = fs::temp_directory_path() / "resmesh_store_test.yaml";
    ASSERT_TRUE(store.save(file).is_ok());

    auto loaded = load_snapshot(file);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.revision, store.revision());
    EXPECT_EQ(loaded.value.allocations.size(), 1u);
    fs::remove(file);
}
