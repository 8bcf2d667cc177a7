#include "command_helpers.hpp"
#include "../theme.hpp"
#include <engine/matching_engine.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static void print_gap_rows(const std::vector<GapEntry>& rows, bool shortage) {
    for (const auto& e : rows) {
        std::string delta = shortage ? fmt::format("short {}", e.shortage) : fmt::format("+{}", e.surplus);
        std::cout << fmt::format("    {:<20} {:>6} {:>9}  ", e.category_name, e.needed, e.available)
                  << (shortage ? theme::red(delta) : theme::green(delta)) << "\n";
    }
}

static void do_gap(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto report = engine.gap_analysis();

    std::cout << theme::section("Supply gap");
    std::cout << theme::color::DIM
              << fmt::format("    {:<20} {:>6} {:>9}  {}\n", "CATEGORY", "NEEDED", "AVAILABLE", "DELTA")
              << theme::color::RESET;
    print_gap_rows(report.unmet, true);
    print_gap_rows(report.met, false);
    print_gap_rows(report.over_provisioned, false);

    std::cout << "\n";
    std::cout << theme::kv("Gap score", theme::indigo(theme::meter(report.gap_score)) +
                                        fmt::format(" {:.0f}%", report.gap_score * 100.0));
    std::cout << theme::kv("Required", std::to_string(report.total_required));
    std::cout << theme::kv("Matched", std::to_string(report.total_matched));
    std::cout << theme::kv("Available", std::to_string(report.total_available));
    std::cout << "\n";
}

// demand [lookback_days] [top=N]
static void do_demand(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    std::optional<int> lookback;
    if (!args.positional.empty()) {
        lookback = parse_id(args.positional[0]);
        if (!lookback) {
            std::cout << theme::fail("Usage: demand [lookback_days] [top=N]");
            return;
        }
    }
    int top = safe_stoi(args.get("top", "15"), 15);

    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto result = engine.demand_scores(lookback);

    std::cout << theme::section("Demand ranking");
    int shown = 0;
    for (const auto& s : result.scores) {
        if (shown++ >= top) break;
        std::cout << fmt::format("    {:<28} ", asset_label(*snap, s.asset_id))
                  << theme::indigo(theme::meter(s.score))
                  << theme::dim(fmt::format("  {:.3f}  raw {:.5f}", s.score, s.raw_score)) << "\n";
    }
    std::cout << "\n";
    std::cout << theme::kv("Graph", fmt::format("{} nodes, {} edges", result.node_count, result.edge_count));
    std::cout << theme::kv("Iterations", std::to_string(result.iterations));
    if (!result.converged) {
        std::cout << theme::info("Iteration cap reached: scores are approximate.");
    }
    std::cout << "\n";
}

static void do_collab(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto graph = engine.collaboration_graph();

    std::cout << theme::section("Collaboration clusters");
    int singletons = 0;
    for (const auto& c : graph.communities) {
        if (c.asset_ids.size() < 2) {
            singletons++;
            continue;
        }
        std::vector<std::string> names;
        for (int id : c.asset_ids) {
            const Asset* a = snap->find_asset(id);
            names.push_back(a ? a->name : fmt::format("#{}", id));
        }
        std::string members;
        for (size_t i = 0; i < names.size(); i++) {
            if (i > 0) members += ", ";
            members += names[i];
        }
        std::cout << theme::step(fmt::format("#{} ({} assets): {}", c.id, c.asset_ids.size(), members));
    }
    if (singletons > 0) {
        std::cout << theme::dim(fmt::format("    {} assets never shared a project or team", singletons)) << "\n";
    }

    std::vector<CollabEdge> strongest = graph.edges;
    std::sort(strongest.begin(), strongest.end(), [](const CollabEdge& a, const CollabEdge& b) {
        if (a.weight != b.weight) return a.weight > b.weight;
        if (a.source != b.source) return a.source < b.source;
        return a.target < b.target;
    });
    if (!strongest.empty()) {
        std::cout << "\n" << theme::dim("    Strongest pairs") << "\n";
        for (size_t i = 0; i < strongest.size() && i < 5; i++) {
            const auto& e = strongest[i];
            std::cout << fmt::format("    {} + {}  x{}\n", asset_label(*snap, e.source),
                                     asset_label(*snap, e.target), e.weight);
        }
    }
    std::cout << "\n";
}

// trend <from YYYY-MM-DD> <to YYYY-MM-DD> [window=7] [step=1] [metric=total_hours] [asset=id]
static void do_trend(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    const char* usage = "Usage: trend <from> <to> [window=N] [step=N] [metric=total_hours|average_hours|utilization_pct] [asset=id]";
    if (args.positional.size() < 2) {
        std::cout << theme::fail(usage);
        return;
    }

    auto from = parse_date(args.positional[0]);
    auto to = parse_date(args.positional[1]);
    if (!from || !to) {
        std::cout << theme::fail("Dates must be YYYY-MM-DD");
        return;
    }

    EngineConfig ec = cli.engine_config();
    TrendRequest req;
    req.from_day = *from;
    req.to_day = *to;
    req.window_days = safe_stoi(args.get("window", std::to_string(ec.trend.window_days)), 0);
    req.step_days = safe_stoi(args.get("step", std::to_string(ec.trend.step_days)), 0);
    if (args.has("metric")) {
        auto m = parse_trend_metric(args.get("metric"));
        if (!m) {
            std::cout << theme::fail(usage);
            return;
        }
        req.metric = *m;
    }
    if (args.has("asset")) {
        req.asset_id = parse_id(args.get("asset"));
        if (!req.asset_id) {
            std::cout << theme::fail("Bad asset id: " + args.get("asset"));
            return;
        }
    }

    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, ec);
    auto r = engine.utilization_trend(req);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    const auto& result = r.value;

    std::cout << theme::section(fmt::format("Utilization {} ({}-day window)", to_string(req.metric), req.window_days));
    if (result.points.empty()) {
        std::cout << theme::dim("    Range is shorter than one window.") << "\n";
    }
    double peak = 0.0;
    for (const auto& p : result.points) peak = std::max(peak, p.value);
    for (const auto& p : result.points) {
        std::cout << fmt::format("    {}  ", format_date(p.window_start))
                  << theme::indigo(theme::meter(peak > 0 ? p.value / peak : 0.0, 20))
                  << fmt::format("  {:.2f}\n", p.value);
    }

    if (!result.peak_days.empty()) {
        std::cout << "\n" << theme::dim("    Peak days") << "\n";
        for (const auto& d : result.peak_days) {
            std::cout << fmt::format("    {}  {:.1f} h\n", format_date(d.day), d.hours);
        }
    }
    if (!result.idle_assets.empty()) {
        std::cout << "\n" << theme::dim(fmt::format("    Idle assets ({} of {} tracked)",
                                                    result.idle_assets.size(), result.tracked_assets)) << "\n";
        for (const auto& a : result.idle_assets) {
            std::cout << fmt::format("    {:<28} {:.2f} h/day\n", asset_label(*snap, a.asset_id), a.avg_daily_hours);
        }
    }
    std::cout << "\n";
}

static void do_costs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto report = engine.cost_analysis();

    std::cout << theme::section("Cost by team");
    std::cout << theme::color::DIM
              << fmt::format("    {:<20} {:>6} {:>12} {:>12} {:>14}\n", "TEAM", "ASSETS", "DAILY", "MONTHLY", "TOTAL SPENT")
              << theme::color::RESET;
    for (const auto& t : report.by_team) {
        std::cout << fmt::format("    {:<20} {:>6} {:>12} {:>12} {:>14}\n", t.team_name, t.assets_held,
                                 format_money(t.daily_cost), format_money(t.monthly_cost),
                                 format_money(t.total_spent));
    }

    std::cout << theme::section("Idle spend");
    for (const auto& w : report.wasted) {
        std::cout << fmt::format("    {:<28} {:>10}/day  util {:>3.0f}%  ", asset_label(*snap, w.asset_id),
                                 format_money(w.cost_per_day), w.utilization_rate)
                  << theme::red(format_money(w.wasted_per_day) + " wasted") << "\n";
    }
    std::cout << "\n" << theme::kv("Held/day", format_money(report.total_daily_cost));
    std::cout << theme::kv("Wasted/day", format_money(report.total_wasted_per_day));
    std::cout << "\n";
}

void register_analytics_commands(BaseCLI& cli) {
    cli.add_command("gap", do_gap, "Demand vs supply per category");
    cli.add_command("demand", do_demand, "Assets ranked by demand [lookback_days]");
    cli.add_command("collab", do_collab, "Assets used together");
    cli.add_command("trend", do_trend, "Utilization over <from> <to> [window=] [step=] [metric=]");
    cli.add_command("costs", do_costs, "Spend per team and idle cost");
}
