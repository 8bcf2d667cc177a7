#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <ctime>
#include <core/capability.hpp>
#include <core/constants.hpp>

// Error categories surfaced to callers
enum class ErrorCode {
    None,
    NotFound,
    InvalidInput,
    Conflict,
    Io,
    Parse,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::InvalidInput) {
        return {false, T{}, err, code};
    }

    static Result<T> NotFound(const std::string& err) {
        return {false, T{}, err, ErrorCode::NotFound};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is_not_found() const { return code == ErrorCode::NotFound; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::InvalidInput) {
        return {false, err, code};
    }

    static Result<void> NotFound(const std::string& err) {
        return {false, err, ErrorCode::NotFound};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is_not_found() const { return code == ErrorCode::NotFound; }
};

// ── Enumerations ────────────────────────────────────────────

enum class AssetStatus { Available, InUse, Maintenance, Retired };
enum class ProjectStatus { Planning, Active, OnHold, Completed, Cancelled };
enum class ProjectPriority { Low, Medium, High, Critical };
enum class RequirementPriority { Required, Preferred, Optional };
enum class AllocationStatus { Active, Released, Overdue };
enum class UsageAction { Allocated, Released, MaintenanceStart, MaintenanceEnd, StatusChange };

// String forms match the snapshot file format ("in_use", "on_hold", ...).
const char* to_string(AssetStatus s);
const char* to_string(ProjectStatus s);
const char* to_string(ProjectPriority p);
const char* to_string(RequirementPriority p);
const char* to_string(AllocationStatus s);
const char* to_string(UsageAction a);

std::optional<AssetStatus> parse_asset_status(const std::string& s);
std::optional<ProjectStatus> parse_project_status(const std::string& s);
std::optional<ProjectPriority> parse_project_priority(const std::string& s);
std::optional<RequirementPriority> parse_requirement_priority(const std::string& s);
std::optional<AllocationStatus> parse_allocation_status(const std::string& s);
std::optional<UsageAction> parse_usage_action(const std::string& s);

// ── Entities ────────────────────────────────────────────────

struct AssetCategory {
    int id = 0;
    std::string name;
    std::string color;               // display tag, e.g. "#6366f1"
    std::string icon;
    std::string description;
};

struct Team {
    int id = 0;
    std::string name;
    std::string department;
    double budget = 0.0;
    int headcount = 0;
};

struct Requirement {
    int id = 0;
    int project_id = 0;
    int category_id = 0;
    int quantity_needed = 1;
    RequirementPriority priority = RequirementPriority::Required;
    CapabilityMap min_spec;          // empty = no constraint
};

struct Project {
    int id = 0;
    std::string name;
    int team_id = 0;
    ProjectStatus status = ProjectStatus::Planning;
    ProjectPriority priority = ProjectPriority::Medium;
    std::string start_date;          // YYYY-MM-DD, may be empty
    std::string end_date;
    double budget = 0.0;
};

struct Asset {
    int id = 0;
    std::string name;
    std::string asset_tag;
    int category_id = 0;
    AssetStatus status = AssetStatus::Available;
    CapabilityMap specification;
    double cost_per_hour = 0.0;
    double cost_per_day = 0.0;
    double utilization_rate = 0.0;   // 0..100
    double total_hours_used = 0.0;
    std::optional<int> current_team_id;
    std::optional<std::time_t> last_used_at;
};

struct Allocation {
    int id = 0;
    int asset_id = 0;
    int team_id = 0;
    std::optional<int> project_id;
    std::time_t allocated_at = 0;
    std::optional<std::time_t> released_at;
    AllocationStatus status = AllocationStatus::Active;
    double actual_hours_used = 0.0;

    bool is_open() const { return status != AllocationStatus::Released && !released_at; }
};

struct UsageLog {
    int id = 0;
    int asset_id = 0;
    int team_id = 0;
    std::optional<int> project_id;
    UsageAction action = UsageAction::Allocated;
    double hours_used = 0.0;
    std::time_t timestamp = 0;
};

// ── Configuration structures ────────────────────────────────

enum class ConsumerKey { Team, TeamProject };
enum class AvailabilityMode { Flat, Recency };

struct DemandConfig {
    double damping = DEMAND_DAMPING;
    double epsilon = DEMAND_EPSILON;
    int max_iterations = DEMAND_MAX_ITERATIONS;
    ConsumerKey consumer_key = ConsumerKey::Team;
    int lookback_days = 0;           // 0 = all history
};

struct GapConfig {
    std::vector<ProjectStatus> demand_statuses = {ProjectStatus::Planning, ProjectStatus::Active};
};

struct MatchingConfig {
    double spec_weight = MATCH_SPEC_WEIGHT;
    double availability_weight = MATCH_AVAILABILITY_WEIGHT;
    double cost_weight = MATCH_COST_WEIGHT;
    AvailabilityMode availability_mode = AvailabilityMode::Flat;
    double recency_half_life_days = MATCH_RECENCY_HALF_LIFE;
};

struct OptimizerConfig {
    double budget_days = OPTIMIZER_BUDGET_DAYS;     // project budget / budget_days = daily ceiling
    int max_steps = OPTIMIZER_MAX_STEPS;         // max DP capacity columns
};

struct TrendConfig {
    int window_days = TREND_WINDOW_DAYS;
    int step_days = TREND_STEP_DAYS;
    double idle_hours_per_day = TREND_IDLE_HOURS_PER_DAY;
};

struct EngineConfig {
    DemandConfig demand;
    GapConfig gap;
    MatchingConfig matching;
    OptimizerConfig optimizer;
    TrendConfig trend;
};

// Status callback for long-running operations
using StatusCallback = std::function<void(const std::string&)>;
