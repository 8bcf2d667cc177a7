#include "types.hpp"

const char* to_string(AssetStatus s) {
    switch (s) {
        case AssetStatus::Available:   return "available";
        case AssetStatus::InUse:       return "in_use";
        case AssetStatus::Maintenance: return "maintenance";
        case AssetStatus::Retired:     return "retired";
    }
    return "available";
}

const char* to_string(ProjectStatus s) {
    switch (s) {
        case ProjectStatus::Planning:  return "planning";
        case ProjectStatus::Active:    return "active";
        case ProjectStatus::OnHold:    return "on_hold";
        case ProjectStatus::Completed: return "completed";
        case ProjectStatus::Cancelled: return "cancelled";
    }
    return "planning";
}

const char* to_string(ProjectPriority p) {
    switch (p) {
        case ProjectPriority::Low:      return "low";
        case ProjectPriority::Medium:   return "medium";
        case ProjectPriority::High:     return "high";
        case ProjectPriority::Critical: return "critical";
    }
    return "medium";
}

const char* to_string(RequirementPriority p) {
    switch (p) {
        case RequirementPriority::Required:  return "required";
        case RequirementPriority::Preferred: return "preferred";
        case RequirementPriority::Optional:  return "optional";
    }
    return "required";
}

const char* to_string(AllocationStatus s) {
    switch (s) {
        case AllocationStatus::Active:   return "active";
        case AllocationStatus::Released: return "released";
        case AllocationStatus::Overdue:  return "overdue";
    }
    return "active";
}

const char* to_string(UsageAction a) {
    switch (a) {
        case UsageAction::Allocated:        return "allocated";
        case UsageAction::Released:         return "released";
        case UsageAction::MaintenanceStart: return "maintenance_start";
        case UsageAction::MaintenanceEnd:   return "maintenance_end";
        case UsageAction::StatusChange:     return "status_change";
    }
    return "allocated";
}

std::optional<AssetStatus> parse_asset_status(const std::string& s) {
    if (s == "available") return AssetStatus::Available;
    if (s == "in_use") return AssetStatus::InUse;
    if (s == "maintenance") return AssetStatus::Maintenance;
    if (s == "retired") return AssetStatus::Retired;
    return std::nullopt;
}

std::optional<ProjectStatus> parse_project_status(const std::string& s) {
    if (s == "planning") return ProjectStatus::Planning;
    if (s == "active") return ProjectStatus::Active;
    if (s == "on_hold") return ProjectStatus::OnHold;
    if (s == "completed") return ProjectStatus::Completed;
    if (s == "cancelled") return ProjectStatus::Cancelled;
    return std::nullopt;
}

std::optional<ProjectPriority> parse_project_priority(const std::string& s) {
    if (s == "low") return ProjectPriority::Low;
    if (s == "medium") return ProjectPriority::Medium;
    if (s == "high") return ProjectPriority::High;
    if (s == "critical") return ProjectPriority::Critical;
    return std::nullopt;
}

std::optional<RequirementPriority> parse_requirement_priority(const std::string& s) {
    if (s == "required") return RequirementPriority::Required;
    if (s == "preferred") return RequirementPriority::Preferred;
    if (s == "optional") return RequirementPriority::Optional;
    return std::nullopt;
}

std::optional<AllocationStatus> parse_allocation_status(const std::string& s) {
    if (s == "active") return AllocationStatus::Active;
    if (s == "released") return AllocationStatus::Released;
    if (s == "overdue") return AllocationStatus::Overdue;
    return std::nullopt;
}

std::optional<UsageAction> parse_usage_action(const std::string& s) {
    if (s == "allocated") return UsageAction::Allocated;
    if (s == "released") return UsageAction::Released;
    if (s == "maintenance_start") return UsageAction::MaintenanceStart;
    if (s == "maintenance_end") return UsageAction::MaintenanceEnd;
    if (s == "status_change") return UsageAction::StatusChange;
    return std::nullopt;
}
