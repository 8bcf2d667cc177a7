#include <gtest/gtest.h>
#include <engine/trend_aggregator.hpp>
#include <core/time_utils.hpp>

static UsageLog log_at(int id, int asset_id, long day, double hours, int hour_of_day = 12) {
    UsageLog log;
    log.id = id;
    log.asset_id = asset_id;
    log.team_id = 1;
    log.action = UsageAction::Released;
    log.hours_used = hours;
    log.timestamp = day_start(day) + hour_of_day * 3600;
    return log;
}

static Asset asset(int id, AssetStatus status = AssetStatus::Available) {
    Asset a;
    a.id = id;
    a.name = "asset-" + std::to_string(id);
    a.category_id = 1;
    a.status = status;
    return a;
}

class TrendTest : public ::testing::Test {
protected:
    void SetUp() override {
        D0 = *parse_date("2025-03-01");
        // 14 days, uneven usage on two assets
        const double hours[14] = {3, 0, 7.25, 1, 0, 0, 12.5, 4, 4, 0, 9, 2.75, 0, 6};
        int id = 1;
        for (long d = 0; d < 14; d++) {
            if (hours[d] > 0) logs.push_back(log_at(id++, 1, D0 + d, hours[d]));
            if (d % 3 == 0) logs.push_back(log_at(id++, 2, D0 + d, 0.5, 23));
        }
        daily_total.assign(14, 0.0);
        for (const auto& l : logs) daily_total[static_cast<size_t>(day_index(l.timestamp) - D0)] += l.hours_used;
    }

    double naive_window(long start, int window) const {
        double sum = 0.0;
        for (long d = start; d < start + window; d++) sum += daily_total[static_cast<size_t>(d)];
        return sum;
    }

    long D0 = 0;
    std::vector<UsageLog> logs;
    std::vector<double> daily_total;
};

TEST_F(TrendTest, SlidingSumsMatchNaive) {
    for (int window : {1, 3, 7}) {
        for (int step : {1, 2, 5, 9}) {
            TrendRequest req;
            req.from_day = D0;
            req.to_day = D0 + 13;
            req.window_days = window;
            req.step_days = step;

            auto result = aggregate_trend(logs, {asset(1), asset(2)}, req);
            size_t expected = 0;
            for (long s = 0; s + window <= 14; s += step) expected++;
            ASSERT_EQ(result.points.size(), expected) << "window " << window << " step " << step;

            for (size_t i = 0; i < result.points.size(); i++) {
                long start = static_cast<long>(i) * step;
                EXPECT_EQ(result.points[i].window_start, D0 + start);
                EXPECT_NEAR(result.points[i].value, naive_window(start, window), 1e-9)
                    << "window " << window << " step " << step << " start " << start;
            }
        }
    }
}

TEST_F(TrendTest, AverageAndUtilization) {
    TrendRequest req;
    req.from_day = D0;
    req.to_day = D0 + 6;
    req.window_days = 7;

    req.metric = TrendMetric::AverageHours;
    auto avg = aggregate_trend(logs, {asset(1), asset(2)}, req);
    ASSERT_EQ(avg.points.size(), 1u);
    EXPECT_NEAR(avg.points[0].value, naive_window(0, 7) / 7.0, 1e-9);

    req.metric = TrendMetric::UtilizationPct;
    auto util = aggregate_trend(logs, {asset(1), asset(2)}, req);
    EXPECT_NEAR(util.points[0].value, naive_window(0, 7) / 7.0 / 48.0 * 100.0, 1e-9);
    EXPECT_EQ(util.tracked_assets, 2);
}

TEST_F(TrendTest, SingleAssetFilter) {
    TrendRequest req;
    req.from_day = D0;
    req.to_day = D0 + 13;
    req.window_days = 14;
    req.asset_id = 2;

    auto result = aggregate_trend(logs, {asset(1), asset(2)}, req);
    ASSERT_EQ(result.points.size(), 1u);
    EXPECT_NEAR(result.points[0].value, 2.5, 1e-9);   // days 0, 3, 6, 9, 12
    EXPECT_EQ(result.tracked_assets, 1);
}

TEST_F(TrendTest, PeakDays) {
    TrendRequest req;
    req.from_day = D0;
    req.to_day = D0 + 13;

    auto result = aggregate_trend(logs, {asset(1), asset(2)}, req);
    ASSERT_EQ(result.peak_days.size(), static_cast<size_t>(TREND_PEAK_DAYS));
    EXPECT_EQ(result.peak_days[0].day, D0 + 6);
    EXPECT_NEAR(result.peak_days[0].hours, 13.0, 1e-9);
    EXPECT_EQ(result.peak_days[1].day, D0 + 10);
    // Days 7 and 8 tie at 4h; the earlier one makes the cut
    EXPECT_EQ(result.peak_days[4].day, D0 + 7);
    for (size_t i = 1; i < result.peak_days.size(); i++) {
        EXPECT_LE(result.peak_days[i].hours, result.peak_days[i - 1].hours);
    }
}

TEST_F(TrendTest, IdleAssets) {
    TrendRequest req;
    req.from_day = D0;
    req.to_day = D0 + 13;

    std::vector<Asset> assets = {asset(1), asset(2), asset(3), asset(4, AssetStatus::Retired)};
    auto result = aggregate_trend(logs, assets, req, 1.0);

    // asset 3 never used, asset 2 averages 2.5 / 14, asset 1 is busy, 4 is retired
    ASSERT_EQ(result.idle_assets.size(), 2u);
    EXPECT_EQ(result.idle_assets[0].asset_id, 3);
    EXPECT_DOUBLE_EQ(result.idle_assets[0].avg_daily_hours, 0.0);
    EXPECT_EQ(result.idle_assets[1].asset_id, 2);
    EXPECT_NEAR(result.idle_assets[1].avg_daily_hours, 2.5 / 14.0, 1e-9);
    EXPECT_EQ(result.tracked_assets, 3);
}

TEST_F(TrendTest, RangeShorterThanWindow) {
    TrendRequest req;
    req.from_day = D0;
    req.to_day = D0 + 2;
    req.window_days = 7;
    auto result = aggregate_trend(logs, {asset(1)}, req);
    EXPECT_TRUE(result.points.empty());
}

TEST_F(TrendTest, InvertedRangeIsEmpty) {
    TrendRequest req;
    req.from_day = D0 + 5;
    req.to_day = D0;
    auto result = aggregate_trend(logs, {asset(1)}, req);
    EXPECT_TRUE(result.points.empty());
    EXPECT_TRUE(result.peak_days.empty());
}

TEST(TrendBuckets, IgnoresOutOfRangeLogs) {
    long d = *parse_date("2025-01-10");
    std::vector<UsageLog> logs = {
        log_at(1, 1, d - 1, 5.0),
        log_at(2, 1, d, 1.5),
        log_at(3, 1, d + 2, 2.0),
        log_at(4, 1, d + 3, 9.0),
    };
    auto daily = bucket_daily_hours(logs, d, d + 2);
    EXPECT_EQ(daily, (std::vector<int64_t>{150, 0, 200}));
}

TEST(TrendBuckets, WindowSumsWithGaps) {
    std::vector<int64_t> daily = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    EXPECT_EQ(window_sums(daily, 3, 1), (std::vector<int64_t>{6, 9, 12, 15, 18, 21, 24, 27}));
    EXPECT_EQ(window_sums(daily, 2, 4), (std::vector<int64_t>{3, 11, 19}));
    EXPECT_EQ(window_sums(daily, 11, 1), std::vector<int64_t>{});
    EXPECT_TRUE(window_sums(daily, 0, 1).empty());
}

TEST(TrendMetricNames, ParseAndPrint) {
    EXPECT_EQ(parse_trend_metric("avg"), TrendMetric::AverageHours);
    EXPECT_EQ(parse_trend_metric("utilization_pct"), TrendMetric::UtilizationPct);
    EXPECT_FALSE(parse_trend_metric("median").has_value());
    EXPECT_STREQ(to_string(TrendMetric::TotalHours), "total_hours");
}
