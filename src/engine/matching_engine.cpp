#include "matching_engine.hpp"
#include <core/time_utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

static void engine_log(const std::string& msg) {
    resmesh_log("engine", msg);
}

MatchingEngine::MatchingEngine(const SnapshotReader& snapshot, EngineConfig config)
    : snapshot_(snapshot), config_(std::move(config)) {}

// ── Matching ─────────────────────────────────────────────────

Result<UrgentMatchResult> MatchingEngine::urgent_match(const UrgentRequest& request) const {
    if (request.quantity < 1) {
        return Result<UrgentMatchResult>::Err("quantity must be at least 1");
    }
    if (!snapshot_.find_category(request.category_id)) {
        return Result<UrgentMatchResult>::NotFound(
            fmt::format("Category {} not found", request.category_id));
    }

    AssetFilter filter;
    filter.category_id = request.category_id;
    auto category_assets = snapshot_.list_assets(filter);

    std::vector<Allocation> history;
    if (config_.matching.availability_mode == AvailabilityMode::Recency) {
        history = snapshot_.list_allocations();
    }

    return Result<UrgentMatchResult>::Ok(
        match_urgent(category_assets, history, request, config_.matching, snapshot_.as_of()));
}

Result<OptimizationResult> MatchingEngine::optimize_for_project(int project_id) const {
    const Project* project = snapshot_.find_project(project_id);
    if (!project) {
        return Result<OptimizationResult>::NotFound(fmt::format("Project {} not found", project_id));
    }

    auto result = optimize_allocation(*project,
                                      snapshot_.list_project_requirements(project_id),
                                      snapshot_.list_categories(),
                                      snapshot_.list_assets(),
                                      snapshot_.list_allocations(),
                                      config_.optimizer);
    return Result<OptimizationResult>::Ok(std::move(result));
}

Result<std::vector<int>> MatchingEngine::upgrade_path(int source_asset_id, const UpgradeTarget& target) const {
    const Asset* source = snapshot_.find_asset(source_asset_id);
    if (!source) {
        return Result<std::vector<int>>::NotFound(fmt::format("Asset {} not found", source_asset_id));
    }
    if (!target.asset_id && !target.spec) {
        return Result<std::vector<int>>::Err("upgrade target needs an asset or a capability level");
    }
    if (target.asset_id) {
        const Asset* dest = snapshot_.find_asset(*target.asset_id);
        if (!dest) {
            return Result<std::vector<int>>::NotFound(fmt::format("Asset {} not found", *target.asset_id));
        }
        if (dest->category_id != source->category_id) {
            engine_log(fmt::format("upgrade {} -> {}: different categories", source_asset_id, dest->id));
            return Result<std::vector<int>>::Ok({});
        }
    }

    AssetFilter filter;
    filter.category_id = source->category_id;
    return Result<std::vector<int>>::Ok(
        find_upgrade_path(snapshot_.list_assets(filter), source_asset_id, target));
}

// ── Analytics ────────────────────────────────────────────────

GapReport MatchingEngine::gap_analysis() const {
    return analyze_gaps(snapshot_.list_categories(),
                        snapshot_.list_requirements(config_.gap.demand_statuses),
                        snapshot_.list_assets());
}

DemandResult MatchingEngine::demand_scores(std::optional<int> lookback_days) const {
    int days = lookback_days ? *lookback_days : config_.demand.lookback_days;
    auto allocations = filter_lookback(snapshot_.list_allocations(), snapshot_.as_of(), days);
    engine_log(fmt::format("demand: {} allocations in window (lookback={}d)", allocations.size(), days));
    return rank_demand(snapshot_.list_assets(), allocations, config_.demand);
}

CollaborationGraph MatchingEngine::collaboration_graph() const {
    return group_collaborations(snapshot_.list_assets(), snapshot_.list_allocations());
}

Result<TrendResult> MatchingEngine::utilization_trend(const TrendRequest& request) const {
    if (request.window_days < 1 || request.step_days < 1) {
        return Result<TrendResult>::Err("window and step must be at least 1 day");
    }
    if (request.asset_id && !snapshot_.find_asset(*request.asset_id)) {
        return Result<TrendResult>::NotFound(fmt::format("Asset {} not found", *request.asset_id));
    }
    if (request.to_day < request.from_day) {
        return Result<TrendResult>::Ok(TrendResult{});
    }

    auto logs = snapshot_.list_usage_logs(day_start(request.from_day), day_start(request.to_day + 1));
    return Result<TrendResult>::Ok(
        aggregate_trend(logs, snapshot_.list_assets(), request, config_.trend.idle_hours_per_day));
}

CostReport MatchingEngine::cost_analysis() const {
    return analyze_costs(snapshot_.list_teams(), snapshot_.list_assets());
}
