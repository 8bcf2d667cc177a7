#include "trend_aggregator.hpp"
#include <core/time_utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>

static void trend_log(const std::string& msg) {
    resmesh_log("trend", msg);
}

const char* to_string(TrendMetric m) {
    switch (m) {
        case TrendMetric::TotalHours:     return "total_hours";
        case TrendMetric::AverageHours:   return "average_hours";
        case TrendMetric::UtilizationPct: return "utilization_pct";
    }
    return "total_hours";
}

std::optional<TrendMetric> parse_trend_metric(const std::string& s) {
    if (s == "total_hours" || s == "total") return TrendMetric::TotalHours;
    if (s == "average_hours" || s == "average" || s == "avg") return TrendMetric::AverageHours;
    if (s == "utilization_pct" || s == "utilization" || s == "util") return TrendMetric::UtilizationPct;
    return std::nullopt;
}

static int64_t to_centi_hours(double hours) {
    return static_cast<int64_t>(std::llround(hours * 100.0));
}

std::vector<int64_t> bucket_daily_hours(const std::vector<UsageLog>& logs,
                                        long from_day, long to_day,
                                        std::optional<int> asset_id) {
    if (to_day < from_day) return {};
    std::vector<int64_t> daily(static_cast<size_t>(to_day - from_day + 1), 0);
    for (const auto& log : logs) {
        if (asset_id && log.asset_id != *asset_id) continue;
        long day = day_index(log.timestamp);
        if (day < from_day || day > to_day) continue;
        daily[static_cast<size_t>(day - from_day)] += to_centi_hours(log.hours_used);
    }
    return daily;
}

std::vector<int64_t> window_sums(const std::vector<int64_t>& daily, int window, int step) {
    std::vector<int64_t> sums;
    if (window < 1 || step < 1) return sums;

    size_t W = static_cast<size_t>(window);
    size_t S = static_cast<size_t>(step);
    int64_t sum = 0;
    size_t lo = 0, hi = 0;   // current window covers [lo, hi)

    for (size_t start = 0; start + W <= daily.size(); start += S) {
        // Jumped past the previous window entirely: start over
        if (start >= hi) {
            sum = 0;
            lo = hi = start;
        }
        while (lo < start) sum -= daily[lo++];
        while (hi < start + W) sum += daily[hi++];
        sums.push_back(sum);
    }
    return sums;
}

TrendResult aggregate_trend(const std::vector<UsageLog>& logs,
                            const std::vector<Asset>& assets,
                            const TrendRequest& request,
                            double idle_hours_per_day) {
    TrendResult result;

    std::vector<const Asset*> in_scope;
    for (const auto& a : assets) {
        if (a.status == AssetStatus::Retired) continue;
        if (request.asset_id && a.id != *request.asset_id) continue;
        in_scope.push_back(&a);
    }
    result.tracked_assets = static_cast<int>(in_scope.size());

    if (request.to_day < request.from_day) return result;

    std::vector<int64_t> daily = bucket_daily_hours(logs, request.from_day, request.to_day, request.asset_id);
    std::vector<int64_t> sums = window_sums(daily, request.window_days, request.step_days);

    for (size_t i = 0; i < sums.size(); i++) {
        double total = static_cast<double>(sums[i]) / 100.0;
        double average = total / request.window_days;
        TrendPoint p;
        p.window_start = request.from_day + static_cast<long>(i) * request.step_days;
        switch (request.metric) {
            case TrendMetric::TotalHours:
                p.value = total;
                break;
            case TrendMetric::AverageHours:
                p.value = average;
                break;
            case TrendMetric::UtilizationPct:
                p.value = result.tracked_assets > 0
                    ? average / (24.0 * result.tracked_assets) * 100.0
                    : 0.0;
                break;
        }
        result.points.push_back(p);
    }

    // Peak days
    std::vector<PeakDay> days;
    for (size_t i = 0; i < daily.size(); i++) {
        if (daily[i] <= 0) continue;
        days.push_back({request.from_day + static_cast<long>(i), static_cast<double>(daily[i]) / 100.0});
    }
    std::stable_sort(days.begin(), days.end(),
                     [](const PeakDay& a, const PeakDay& b) { return a.hours > b.hours; });
    if (days.size() > static_cast<size_t>(TREND_PEAK_DAYS)) days.resize(TREND_PEAK_DAYS);
    result.peak_days = days;

    // Idle assets: average daily hours across the whole range
    std::map<int, int64_t> per_asset;
    long first = request.from_day, last = request.to_day;
    for (const auto& log : logs) {
        long day = day_index(log.timestamp);
        if (day < first || day > last) continue;
        per_asset[log.asset_id] += to_centi_hours(log.hours_used);
    }
    double range_days = static_cast<double>(last - first + 1);
    for (const Asset* a : in_scope) {
        double avg = static_cast<double>(per_asset[a->id]) / 100.0 / range_days;
        if (avg < idle_hours_per_day) {
            result.idle_assets.push_back({a->id, a->name, avg});
        }
    }
    std::sort(result.idle_assets.begin(), result.idle_assets.end(),
              [](const IdleAsset& x, const IdleAsset& y) {
                  if (x.avg_daily_hours != y.avg_daily_hours) return x.avg_daily_hours < y.avg_daily_hours;
                  return x.asset_id < y.asset_id;
              });

    trend_log(fmt::format("range={}..{} window={} step={} metric={} points={} tracked={}",
                          format_date(request.from_day), format_date(request.to_day),
                          request.window_days, request.step_days, to_string(request.metric),
                          result.points.size(), result.tracked_assets));
    return result;
}
