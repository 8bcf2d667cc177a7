#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <snapshot/snapshot.hpp>
#include "demand_ranker.hpp"
#include "gap_analyzer.hpp"
#include "urgent_matcher.hpp"
#include "allocation_optimizer.hpp"
#include "collaboration_grouper.hpp"
#include "trend_aggregator.hpp"
#include "upgrade_path.hpp"
#include "cost_analyzer.hpp"

// Stateless facade over the engine components. Every operation is a pure
// function of the snapshot plus its arguments; nothing is cached, so a new
// snapshot (after allocate/release) only needs a new engine.
//
// The snapshot must outlive the engine.
class MatchingEngine {
public:
    MatchingEngine(const SnapshotReader& snapshot, EngineConfig config = {});

    // ── Matching ──────────────────────────────────────────────

    // Rank available assets of a category for an urgent request.
    // NotFound for an unknown category, InvalidInput for quantity < 1.
    Result<UrgentMatchResult> urgent_match(const UrgentRequest& request) const;

    // Best-coverage asset set for a project within its budget.
    Result<OptimizationResult> optimize_for_project(int project_id) const;

    // Shortest chain of strict upgrades from `source_asset_id` within its category.
    Result<std::vector<int>> upgrade_path(int source_asset_id, const UpgradeTarget& target) const;

    // ── Analytics ─────────────────────────────────────────────

    GapReport gap_analysis() const;

    // lookback_days overrides demand.lookback_days when given (0 = all history)
    DemandResult demand_scores(std::optional<int> lookback_days = std::nullopt) const;

    CollaborationGraph collaboration_graph() const;

    // InvalidInput for window/step < 1, NotFound for an unknown asset filter
    Result<TrendResult> utilization_trend(const TrendRequest& request) const;

    CostReport cost_analysis() const;

    const EngineConfig& config() const { return config_; }

private:
    const SnapshotReader& snapshot_;
    EngineConfig config_;
};
