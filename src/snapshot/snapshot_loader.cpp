#include "snapshot_loader.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

// Raised while walking the document; converted to a Parse error at the top.
class SnapshotFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Field readers ─────────────────────────────────────────────

int require_int(const YAML::Node& n, const char* key, const std::string& where) {
    if (!n[key] || n[key].IsNull()) {
        throw SnapshotFormatError(fmt::format("{}: missing '{}'", where, key));
    }
    return n[key].as<int>();
}

std::optional<int> optional_int(const YAML::Node& n, const char* key) {
    if (!n[key] || n[key].IsNull()) return std::nullopt;
    return n[key].as<int>();
}

std::time_t require_time(const YAML::Node& n, const char* key, const std::string& where) {
    std::string text = n[key].as<std::string>("");
    std::time_t t = parse_iso_time(text);
    if (t == 0) {
        throw SnapshotFormatError(fmt::format("{}: bad or missing timestamp '{}'", where, key));
    }
    return t;
}

std::optional<std::time_t> optional_time(const YAML::Node& n, const char* key, const std::string& where) {
    if (!n[key] || n[key].IsNull()) return std::nullopt;
    return require_time(n, key, where);
}

template <typename E>
E require_enum(const YAML::Node& n, const char* key, E fallback,
               std::optional<E> (*parse)(const std::string&), const std::string& where) {
    if (!n[key]) return fallback;
    std::string text = n[key].as<std::string>("");
    auto v = parse(text);
    if (!v) {
        throw SnapshotFormatError(fmt::format("{}: unknown {} '{}'", where, key, text));
    }
    return *v;
}

CapabilityMap read_capabilities(const YAML::Node& n, const std::string& where) {
    CapabilityMap caps;
    if (!n || n.IsNull()) return caps;
    if (!n.IsMap()) {
        throw SnapshotFormatError(where + ": capabilities must be a mapping");
    }
    for (const auto& kv : n) {
        std::string key = kv.first.as<std::string>();
        const YAML::Node& value = kv.second;
        if (value.IsSequence()) {
            std::vector<std::string> items;
            for (const auto& item : value) items.push_back(item.as<std::string>());
            caps[key] = CapabilityValue::of_list(std::move(items));
        } else if (value.IsScalar()) {
            caps[key] = capability_from_scalar(value.as<std::string>());
        } else {
            throw SnapshotFormatError(fmt::format("{}: capability '{}' must be a scalar or list", where, key));
        }
    }
    return caps;
}

// ── Entity readers ────────────────────────────────────────────

AssetCategory read_category(const YAML::Node& n) {
    AssetCategory c;
    c.id = require_int(n, "id", "category");
    c.name = n["name"].as<std::string>("");
    c.color = n["color"].as<std::string>("");
    c.icon = n["icon"].as<std::string>("");
    c.description = n["description"].as<std::string>("");
    return c;
}

Team read_team(const YAML::Node& n) {
    Team t;
    t.id = require_int(n, "id", "team");
    t.name = n["name"].as<std::string>("");
    t.department = n["department"].as<std::string>("");
    t.budget = n["budget"].as<double>(0.0);
    t.headcount = n["headcount"].as<int>(0);
    return t;
}

Requirement read_requirement(const YAML::Node& n, int project_id) {
    std::string where = fmt::format("project {} requirement", project_id);
    Requirement r;
    r.id = require_int(n, "id", where);
    r.project_id = project_id;
    r.category_id = require_int(n, "category_id", where);
    r.quantity_needed = n["quantity_needed"].as<int>(1);
    r.priority = require_enum(n, "priority", RequirementPriority::Required,
                              &parse_requirement_priority, where);
    r.min_spec = read_capabilities(n["min_spec"], where);
    return r;
}

Project read_project(const YAML::Node& n, std::vector<Requirement>& requirements) {
    Project p;
    p.id = require_int(n, "id", "project");
    std::string where = fmt::format("project {}", p.id);
    p.name = n["name"].as<std::string>("");
    p.team_id = n["team_id"].as<int>(0);
    p.status = require_enum(n, "status", ProjectStatus::Planning, &parse_project_status, where);
    p.priority = require_enum(n, "priority", ProjectPriority::Medium, &parse_project_priority, where);
    p.start_date = n["start_date"].as<std::string>("");
    p.end_date = n["end_date"].as<std::string>("");
    p.budget = n["budget"].as<double>(0.0);

    if (n["requirements"] && n["requirements"].IsSequence()) {
        for (const auto& rn : n["requirements"]) {
            requirements.push_back(read_requirement(rn, p.id));
        }
    }
    return p;
}

Asset read_asset(const YAML::Node& n) {
    Asset a;
    a.id = require_int(n, "id", "asset");
    std::string where = fmt::format("asset {}", a.id);
    a.name = n["name"].as<std::string>("");
    a.asset_tag = n["asset_tag"].as<std::string>("");
    a.category_id = require_int(n, "category_id", where);
    a.status = require_enum(n, "status", AssetStatus::Available, &parse_asset_status, where);
    a.specification = read_capabilities(n["specification"], where);
    a.cost_per_hour = n["cost_per_hour"].as<double>(0.0);
    a.cost_per_day = n["cost_per_day"].as<double>(0.0);
    a.utilization_rate = n["utilization_rate"].as<double>(0.0);
    a.total_hours_used = n["total_hours_used"].as<double>(0.0);
    a.current_team_id = optional_int(n, "current_team_id");
    a.last_used_at = optional_time(n, "last_used_at", where);

    if (a.utilization_rate < 0.0 || a.utilization_rate > 100.0) {
        throw SnapshotFormatError(where + ": utilization_rate must be within [0, 100]");
    }
    return a;
}

Allocation read_allocation(const YAML::Node& n) {
    Allocation al;
    al.id = require_int(n, "id", "allocation");
    std::string where = fmt::format("allocation {}", al.id);
    al.asset_id = require_int(n, "asset_id", where);
    al.team_id = require_int(n, "team_id", where);
    al.project_id = optional_int(n, "project_id");
    al.allocated_at = require_time(n, "allocated_at", where);
    al.released_at = optional_time(n, "released_at", where);
    al.status = require_enum(n, "status", AllocationStatus::Active, &parse_allocation_status, where);
    al.actual_hours_used = n["actual_hours_used"].as<double>(0.0);

    if (al.status == AllocationStatus::Released && !al.released_at) {
        throw SnapshotFormatError(where + ": released without released_at");
    }
    return al;
}

UsageLog read_usage_log(const YAML::Node& n) {
    UsageLog log;
    log.id = require_int(n, "id", "usage log");
    std::string where = fmt::format("usage log {}", log.id);
    log.asset_id = require_int(n, "asset_id", where);
    log.team_id = n["team_id"].as<int>(0);
    log.project_id = optional_int(n, "project_id");
    log.action = require_enum(n, "action", UsageAction::Allocated, &parse_usage_action, where);
    log.hours_used = n["hours_used"].as<double>(0.0);
    log.timestamp = require_time(n, "timestamp", where);
    return log;
}

template <typename T, typename Reader>
void read_sequence(const YAML::Node& root, const char* key, std::vector<T>& out, Reader reader) {
    const YAML::Node& seq = root[key];
    if (!seq || seq.IsNull()) return;
    if (!seq.IsSequence()) {
        throw SnapshotFormatError(fmt::format("'{}' must be a list", key));
    }
    for (const auto& n : seq) out.push_back(reader(n));
}

// ── Emitters ──────────────────────────────────────────────────

void emit_capabilities(YAML::Emitter& out, const CapabilityMap& caps) {
    out << YAML::Flow << YAML::BeginMap;
    for (const auto& [key, value] : caps) {
        out << YAML::Key << key << YAML::Value;
        if (value.is_number()) {
            out << value.number;
        } else if (value.is_string()) {
            out << value.text;
        } else {
            out << YAML::Flow << YAML::BeginSeq;
            for (const auto& item : value.items) out << item;
            out << YAML::EndSeq;
        }
    }
    out << YAML::EndMap;
}

void emit_optional_int(YAML::Emitter& out, const char* key, const std::optional<int>& v) {
    out << YAML::Key << key << YAML::Value;
    if (v) out << *v; else out << YAML::Null;
}

void emit_optional_time(YAML::Emitter& out, const char* key, const std::optional<std::time_t>& v) {
    out << YAML::Key << key << YAML::Value;
    if (v) out << format_iso_time(*v); else out << YAML::Null;
}

}  // namespace

Result<SnapshotData> parse_snapshot(const std::string& yaml_text, const std::string& origin) {
    SnapshotData data;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return Result<SnapshotData>::Err(origin + ": top level must be a mapping", ErrorCode::Parse);
        }

        if (root["as_of"]) {
            data.as_of = require_time(root, "as_of", origin);
        } else {
            data.as_of = std::time(nullptr);
        }
        data.revision = root["revision"].as<uint64_t>(0);

        read_sequence(root, "categories", data.categories, read_category);
        read_sequence(root, "teams", data.teams, read_team);
        read_sequence(root, "projects", data.projects,
                      [&data](const YAML::Node& n) { return read_project(n, data.requirements); });
        read_sequence(root, "assets", data.assets, read_asset);
        read_sequence(root, "allocations", data.allocations, read_allocation);
        read_sequence(root, "usage_logs", data.usage_logs, read_usage_log);
    } catch (const SnapshotFormatError& e) {
        return Result<SnapshotData>::Err(origin + ": " + e.what(), ErrorCode::Parse);
    } catch (const YAML::Exception& e) {
        return Result<SnapshotData>::Err(origin + ": " + e.what(), ErrorCode::Parse);
    }

    auto valid = validate_snapshot(data);
    if (valid.is_err()) {
        return Result<SnapshotData>::Err(origin + ": " + valid.error, valid.code);
    }
    return Result<SnapshotData>::Ok(std::move(data));
}

Result<SnapshotData> load_snapshot(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<SnapshotData>::Err("Snapshot not found: " + path.string(), ErrorCode::Io);
    }
    std::ifstream in(path);
    if (!in) {
        return Result<SnapshotData>::Err("Cannot open " + path.string(), ErrorCode::Io);
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse_snapshot(buf.str(), path.string());
}

std::string emit_snapshot(const SnapshotData& data) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "as_of" << YAML::Value << format_iso_time(data.as_of);
    out << YAML::Key << "revision" << YAML::Value << data.revision;

    out << YAML::Key << "categories" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : data.categories) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << c.id;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "color" << YAML::Value << c.color;
        out << YAML::Key << "icon" << YAML::Value << c.icon;
        out << YAML::Key << "description" << YAML::Value << c.description;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "teams" << YAML::Value << YAML::BeginSeq;
    for (const auto& t : data.teams) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << t.id;
        out << YAML::Key << "name" << YAML::Value << t.name;
        out << YAML::Key << "department" << YAML::Value << t.department;
        out << YAML::Key << "budget" << YAML::Value << t.budget;
        out << YAML::Key << "headcount" << YAML::Value << t.headcount;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "projects" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : data.projects) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << p.id;
        out << YAML::Key << "name" << YAML::Value << p.name;
        out << YAML::Key << "team_id" << YAML::Value << p.team_id;
        out << YAML::Key << "status" << YAML::Value << to_string(p.status);
        out << YAML::Key << "priority" << YAML::Value << to_string(p.priority);
        out << YAML::Key << "start_date" << YAML::Value << p.start_date;
        out << YAML::Key << "end_date" << YAML::Value << p.end_date;
        out << YAML::Key << "budget" << YAML::Value << p.budget;
        out << YAML::Key << "requirements" << YAML::Value << YAML::BeginSeq;
        for (const auto& r : data.requirements) {
            if (r.project_id != p.id) continue;
            out << YAML::BeginMap;
            out << YAML::Key << "id" << YAML::Value << r.id;
            out << YAML::Key << "category_id" << YAML::Value << r.category_id;
            out << YAML::Key << "quantity_needed" << YAML::Value << r.quantity_needed;
            out << YAML::Key << "priority" << YAML::Value << to_string(r.priority);
            out << YAML::Key << "min_spec" << YAML::Value;
            emit_capabilities(out, r.min_spec);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "assets" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : data.assets) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << a.id;
        out << YAML::Key << "name" << YAML::Value << a.name;
        out << YAML::Key << "asset_tag" << YAML::Value << a.asset_tag;
        out << YAML::Key << "category_id" << YAML::Value << a.category_id;
        out << YAML::Key << "status" << YAML::Value << to_string(a.status);
        out << YAML::Key << "specification" << YAML::Value;
        emit_capabilities(out, a.specification);
        out << YAML::Key << "cost_per_hour" << YAML::Value << a.cost_per_hour;
        out << YAML::Key << "cost_per_day" << YAML::Value << a.cost_per_day;
        out << YAML::Key << "utilization_rate" << YAML::Value << a.utilization_rate;
        out << YAML::Key << "total_hours_used" << YAML::Value << a.total_hours_used;
        emit_optional_int(out, "current_team_id", a.current_team_id);
        emit_optional_time(out, "last_used_at", a.last_used_at);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "allocations" << YAML::Value << YAML::BeginSeq;
    for (const auto& al : data.allocations) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << al.id;
        out << YAML::Key << "asset_id" << YAML::Value << al.asset_id;
        out << YAML::Key << "team_id" << YAML::Value << al.team_id;
        emit_optional_int(out, "project_id", al.project_id);
        out << YAML::Key << "allocated_at" << YAML::Value << format_iso_time(al.allocated_at);
        emit_optional_time(out, "released_at", al.released_at);
        out << YAML::Key << "status" << YAML::Value << to_string(al.status);
        out << YAML::Key << "actual_hours_used" << YAML::Value << al.actual_hours_used;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "usage_logs" << YAML::Value << YAML::BeginSeq;
    for (const auto& log : data.usage_logs) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << log.id;
        out << YAML::Key << "asset_id" << YAML::Value << log.asset_id;
        out << YAML::Key << "team_id" << YAML::Value << log.team_id;
        emit_optional_int(out, "project_id", log.project_id);
        out << YAML::Key << "action" << YAML::Value << to_string(log.action);
        out << YAML::Key << "hours_used" << YAML::Value << log.hours_used;
        out << YAML::Key << "timestamp" << YAML::Value << format_iso_time(log.timestamp);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<void> save_snapshot(const SnapshotData& data, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err("Failed to create " + path.parent_path().string() + ": " + ec.message(),
                                     ErrorCode::Io);
        }
    }

    std::ofstream fout(path);
    if (!fout) {
        return Result<void>::Err("Cannot write " + path.string(), ErrorCode::Io);
    }
    fout << emit_snapshot(data);
    return Result<void>::Ok();
}
