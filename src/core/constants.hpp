#pragma once

// ── Demand ranking ──────────────────────────────────────────
constexpr double DEMAND_DAMPING          = 0.85;
constexpr double DEMAND_EPSILON          = 1e-6;  // L1 convergence threshold
constexpr int    DEMAND_MAX_ITERATIONS   = 100;   // Hard cap, bounds worst-case latency

// ── Urgent matching ─────────────────────────────────────────
constexpr double MATCH_SPEC_WEIGHT          = 0.4;
constexpr double MATCH_AVAILABILITY_WEIGHT  = 0.3;
constexpr double MATCH_COST_WEIGHT          = 0.3;
constexpr double MATCH_RECENCY_HALF_LIFE    = 7.0;   // days

// ── Allocation optimizer ────────────────────────────────────
constexpr int    PRIORITY_WEIGHT_REQUIRED  = 3;
constexpr int    PRIORITY_WEIGHT_PREFERRED = 2;
constexpr int    PRIORITY_WEIGHT_OPTIONAL  = 1;
constexpr int    OPTIMIZER_MAX_STEPS       = 2000;  // DP capacity columns
constexpr double OPTIMIZER_BUDGET_DAYS     = 1.0;   // budget / days = daily ceiling

// ── Trends ──────────────────────────────────────────────────
constexpr int    TREND_WINDOW_DAYS         = 7;
constexpr int    TREND_STEP_DAYS           = 1;
constexpr double TREND_IDLE_HOURS_PER_DAY  = 2.4;   // < 10% of a day
constexpr int    TREND_PEAK_DAYS           = 5;

// ── Cost analysis ───────────────────────────────────────────
constexpr int    COST_WASTED_TOP_N         = 10;
constexpr int    COST_MONTH_DAYS           = 30;

// ── Misc ────────────────────────────────────────────────────
constexpr int    SECONDS_PER_DAY           = 86400;
constexpr const char* DEFAULT_SNAPSHOT_FILE = "snapshot.yaml";
constexpr const char* RESMESH_VERSION       = "0.4.0";
