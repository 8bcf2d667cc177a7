#pragma once

#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

enum class TrendMetric { TotalHours, AverageHours, UtilizationPct };

const char* to_string(TrendMetric m);
std::optional<TrendMetric> parse_trend_metric(const std::string& s);

struct TrendRequest {
    long from_day = 0;                  // inclusive, UTC day index
    long to_day = 0;                    // inclusive
    int window_days = TREND_WINDOW_DAYS;
    int step_days = TREND_STEP_DAYS;
    TrendMetric metric = TrendMetric::TotalHours;
    std::optional<int> asset_id;        // restrict to one asset
};

struct TrendPoint {
    long window_start = 0;   // day index
    double value = 0.0;
};

struct PeakDay {
    long day = 0;
    double hours = 0.0;
};

struct IdleAsset {
    int asset_id = 0;
    std::string name;
    double avg_daily_hours = 0.0;
};

struct TrendResult {
    std::vector<TrendPoint> points;
    std::vector<PeakDay> peak_days;        // busiest days, hours desc then earlier day
    std::vector<IdleAsset> idle_assets;    // avg asc, then id
    int tracked_assets = 0;                // non-retired assets in scope
};

// Daily hours in hundredths of an hour, one bucket per day of [from_day, to_day].
// Integer buckets keep the running window sum exact.
std::vector<int64_t> bucket_daily_hours(const std::vector<UsageLog>& logs,
                                        long from_day, long to_day,
                                        std::optional<int> asset_id = std::nullopt);

// Sum of each window [s, s+window) for s = 0, step, 2*step, ... while the
// window fits. Each sum is derived from the previous by adding the days that
// enter and subtracting the days that leave.
std::vector<int64_t> window_sums(const std::vector<int64_t>& daily, int window, int step);

// `logs` should cover the requested range; entries outside it are ignored.
TrendResult aggregate_trend(const std::vector<UsageLog>& logs,
                            const std::vector<Asset>& assets,
                            const TrendRequest& request,
                            double idle_hours_per_day = TREND_IDLE_HOURS_PER_DAY);
