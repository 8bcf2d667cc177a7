#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ── Section parsers ───────────────────────────────────────────
// Each overlays only the keys that are present, so a directory config can
// override a single value from the global config.

static Result<void> parse_demand_config(const YAML::Node& node, DemandConfig& demand) {
    demand.damping = node["damping"].as<double>(demand.damping);
    demand.epsilon = node["epsilon"].as<double>(demand.epsilon);
    demand.max_iterations = node["max_iterations"].as<int>(demand.max_iterations);
    demand.lookback_days = node["lookback_days"].as<int>(demand.lookback_days);

    if (node["consumer_key"]) {
        std::string key = node["consumer_key"].as<std::string>("");
        if (key == "team") {
            demand.consumer_key = ConsumerKey::Team;
        } else if (key == "team_project") {
            demand.consumer_key = ConsumerKey::TeamProject;
        } else {
            return Result<void>::Err("demand.consumer_key must be 'team' or 'team_project', got '" + key + "'",
                                     ErrorCode::Parse);
        }
    }

    if (demand.damping <= 0.0 || demand.damping >= 1.0) {
        return Result<void>::Err("demand.damping must be in (0, 1)", ErrorCode::Parse);
    }
    if (demand.max_iterations < 1) {
        return Result<void>::Err("demand.max_iterations must be >= 1", ErrorCode::Parse);
    }
    return Result<void>::Ok();
}

static Result<void> parse_gap_config(const YAML::Node& node, GapConfig& gap) {
    if (!node["demand_statuses"]) return Result<void>::Ok();

    auto names = node["demand_statuses"].as<std::vector<std::string>>(std::vector<std::string>());
    std::vector<ProjectStatus> statuses;
    for (const auto& name : names) {
        auto status = parse_project_status(name);
        if (!status) {
            return Result<void>::Err("gap.demand_statuses: unknown project status '" + name + "'",
                                     ErrorCode::Parse);
        }
        statuses.push_back(*status);
    }
    gap.demand_statuses = statuses;
    return Result<void>::Ok();
}

static Result<void> parse_matching_config(const YAML::Node& node, MatchingConfig& m) {
    m.spec_weight = node["spec_weight"].as<double>(m.spec_weight);
    m.availability_weight = node["availability_weight"].as<double>(m.availability_weight);
    m.cost_weight = node["cost_weight"].as<double>(m.cost_weight);
    m.recency_half_life_days = node["recency_half_life_days"].as<double>(m.recency_half_life_days);

    if (node["availability_mode"]) {
        std::string mode = node["availability_mode"].as<std::string>("");
        if (mode == "flat") {
            m.availability_mode = AvailabilityMode::Flat;
        } else if (mode == "recency") {
            m.availability_mode = AvailabilityMode::Recency;
        } else {
            return Result<void>::Err("matching.availability_mode must be 'flat' or 'recency', got '" + mode + "'",
                                     ErrorCode::Parse);
        }
    }

    if (m.spec_weight < 0 || m.availability_weight < 0 || m.cost_weight < 0) {
        return Result<void>::Err("matching weights must be non-negative", ErrorCode::Parse);
    }
    if (m.recency_half_life_days <= 0) {
        return Result<void>::Err("matching.recency_half_life_days must be positive", ErrorCode::Parse);
    }
    return Result<void>::Ok();
}

static Result<void> parse_optimizer_config(const YAML::Node& node, OptimizerConfig& o) {
    o.budget_days = node["budget_days"].as<double>(o.budget_days);
    o.max_steps = node["max_steps"].as<int>(o.max_steps);

    if (o.budget_days <= 0) {
        return Result<void>::Err("optimizer.budget_days must be positive", ErrorCode::Parse);
    }
    if (o.max_steps < 1) {
        return Result<void>::Err("optimizer.max_steps must be >= 1", ErrorCode::Parse);
    }
    return Result<void>::Ok();
}

static Result<void> parse_trend_config(const YAML::Node& node, TrendConfig& t) {
    t.window_days = node["window_days"].as<int>(t.window_days);
    t.step_days = node["step_days"].as<int>(t.step_days);
    t.idle_hours_per_day = node["idle_hours_per_day"].as<double>(t.idle_hours_per_day);

    if (t.window_days < 1 || t.step_days < 1) {
        return Result<void>::Err("trend.window_days and trend.step_days must be >= 1", ErrorCode::Parse);
    }
    return Result<void>::Ok();
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".resmesh";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "resmesh.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() + ": " + ec.message(),
                                 ErrorCode::Io);
    }

    const char* default_config = R"(# ResMesh configuration
# Keys left out fall back to the defaults shown here.

# Snapshot file opened by the shell when none is given on the command line
snapshot: "snapshot.yaml"

# Debug log (empty = <tmp>/resmesh_debug.log)
log_file: ""

demand:
  damping: 0.85
  epsilon: 1.0e-6
  max_iterations: 100
  consumer_key: team          # team | team_project
  lookback_days: 0            # 0 = all history

gap:
  demand_statuses: [planning, active]

matching:
  spec_weight: 0.4
  availability_weight: 0.3
  cost_weight: 0.3
  availability_mode: flat     # flat | recency
  recency_half_life_days: 7

optimizer:
  budget_days: 1              # project budget / budget_days = daily cost ceiling
  max_steps: 2000

trend:
  window_days: 7
  step_days: 1
  idle_hours_per_day: 2.4
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string(), ErrorCode::Io);
    }
    out << default_config;
    out.close();
    return Result<void>::Ok();
}

static Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err("Cannot open " + path.string(), ErrorCode::Io);
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::Ok(buf.str());
}

Result<void> Config::apply(const std::string& yaml_text, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err(origin + ": top level must be a mapping", ErrorCode::Parse);
        }

        snapshot_path_ = root["snapshot"].as<std::string>(snapshot_path_);
        log_file_ = root["log_file"].as<std::string>(log_file_);

        Result<void> r = Result<void>::Ok();
        if (root["demand"] && (r = parse_demand_config(root["demand"], engine_.demand)).is_err()) {
            return Result<void>::Err(origin + ": " + r.error, r.code);
        }
        if (root["gap"] && (r = parse_gap_config(root["gap"], engine_.gap)).is_err()) {
            return Result<void>::Err(origin + ": " + r.error, r.code);
        }
        if (root["matching"] && (r = parse_matching_config(root["matching"], engine_.matching)).is_err()) {
            return Result<void>::Err(origin + ": " + r.error, r.code);
        }
        if (root["optimizer"] && (r = parse_optimizer_config(root["optimizer"], engine_.optimizer)).is_err()) {
            return Result<void>::Err(origin + ": " + r.error, r.code);
        }
        if (root["trend"] && (r = parse_trend_config(root["trend"], engine_.trend)).is_err()) {
            return Result<void>::Err(origin + ": " + r.error, r.code);
        }
        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(origin + ": " + e.what(), ErrorCode::Parse);
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    config.snapshot_path_ = DEFAULT_SNAPSHOT_FILE;
    config.project_dir_ = fs::current_path();

    auto r = config.apply(yaml_text, "config");
    if (r.is_err()) {
        return Result<Config>::Err(r.error, r.code);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::NotFound("Global config not found at " + get_global_config_path().string());
    }

    auto text = read_file(get_global_config_path());
    if (text.is_err()) {
        return Result<Config>::Err(text.error, text.code);
    }

    Config config;
    config.snapshot_path_ = DEFAULT_SNAPSHOT_FILE;
    config.project_dir_ = fs::current_path();

    auto r = config.apply(text.value, get_global_config_path().string());
    if (r.is_err()) {
        return Result<Config>::Err(r.error, r.code);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::NotFound("Project config not found at " + get_project_config_path(dir).string());
    }

    auto text = read_file(get_project_config_path(dir));
    if (text.is_err()) {
        return Result<Config>::Err(text.error, text.code);
    }

    Config config;
    config.snapshot_path_ = DEFAULT_SNAPSHOT_FILE;
    config.project_dir_ = dir;

    auto r = config.apply(text.value, get_project_config_path(dir).string());
    if (r.is_err()) {
        return Result<Config>::Err(r.error, r.code);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;
    config.snapshot_path_ = DEFAULT_SNAPSHOT_FILE;

    // Global first, then the directory file on top of it
    if (global_config_exists()) {
        auto text = read_file(get_global_config_path());
        if (text.is_err()) {
            return Result<Config>::Err(text.error, text.code);
        }
        auto r = config.apply(text.value, get_global_config_path().string());
        if (r.is_err()) {
            return Result<Config>::Err(r.error, r.code);
        }
    }

    if (project_config_exists(project_dir)) {
        auto text = read_file(get_project_config_path(project_dir));
        if (text.is_err()) {
            return Result<Config>::Err(text.error, text.code);
        }
        auto r = config.apply(text.value, get_project_config_path(project_dir).string());
        if (r.is_err()) {
            return Result<Config>::Err(r.error, r.code);
        }
    }

    config.project_dir_ = project_dir;
    return Result<Config>::Ok(config);
}
