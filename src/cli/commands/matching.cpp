#include "command_helpers.hpp"
#include "../theme.hpp"
#include <engine/matching_engine.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// match <category_id> [qty=N] [max_cost=X] [field=value ...]
static void do_match(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    if (args.positional.empty()) {
        std::cout << theme::fail("Usage: match <category_id> [qty=N] [max_cost=X] [field=value ...]");
        return;
    }

    auto category = parse_id(args.positional[0]);
    if (!category) {
        std::cout << theme::fail("Bad category id: " + args.positional[0]);
        return;
    }

    UrgentRequest req;
    req.category_id = *category;
    req.quantity = safe_stoi(args.get("qty", "1"), 0);
    if (args.has("max_cost")) {
        req.max_daily_cost = safe_stod(args.get("max_cost"), 0.0);
    }
    if (!collect_capabilities(args, {"qty", "max_cost"}, req.min_spec)) return;

    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto r = engine.urgent_match(req);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    const auto& result = r.value;

    std::cout << theme::section(fmt::format("Urgent match: {}", category_label(*snap, req.category_id)));
    if (result.matches.empty()) {
        std::cout << theme::dim("    No available asset fits the request.") << "\n";
    } else {
        std::cout << theme::color::DIM
                  << fmt::format("    {:<24} {:>10}  {:<10} {:>6} {:>6} {:>6}  {}\n",
                                 "ASSET", "COST/DAY", "SCORE", "SPEC", "AVAIL", "COST", "WHY")
                  << theme::color::RESET;
        for (const auto& m : result.matches) {
            std::cout << fmt::format("    {:<24} {:>10}  ", asset_label(*snap, m.asset_id), format_money(m.cost_per_day))
                      << theme::indigo(theme::meter(m.score))
                      << fmt::format(" {:>6.2f} {:>6.2f} {:>6.2f}  ", m.spec_match, m.availability, m.cost_efficiency)
                      << theme::dim(join(m.reasons, ", ")) << "\n";
        }
    }
    std::cout << "\n" << theme::kv("Eligible", std::to_string(result.total_found));
    if (!result.upgrade_path.empty()) {
        std::cout << theme::info("No exact match. Upgrade path: " + format_path(*snap, result.upgrade_path));
    }
    std::cout << "\n";
}

// optimize <project_id>
static void do_optimize(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    std::optional<int> project_id;
    if (!args.positional.empty()) project_id = parse_id(args.positional[0]);
    if (!project_id) {
        std::cout << theme::fail("Usage: optimize <project_id>");
        return;
    }

    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto r = engine.optimize_for_project(*project_id);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    const auto& result = r.value;
    const Project* project = snap->find_project(*project_id);

    std::cout << theme::section("Optimal allocation: " + project->name);
    std::cout << theme::kv("Daily budget", format_money(result.capacity));
    if (result.step > 1) {
        std::cout << theme::kv("Resolution", format_money(static_cast<double>(result.step)));
    }
    std::cout << theme::kv("Candidates", std::to_string(result.candidates));
    std::cout << theme::kv("Coverage", theme::indigo(theme::meter(result.coverage_score)) +
                                       fmt::format(" {:.0f}%", result.coverage_score * 100.0));
    std::cout << theme::kv("Cost/day", format_money(result.total_cost_per_day));
    std::cout << "\n";

    if (result.selected_assets.empty()) {
        std::cout << theme::dim("    Nothing fits the budget.") << "\n";
    }
    for (const auto& a : result.selected_assets) {
        std::cout << theme::ok(fmt::format("{:<24} {:<16} {:>10}", asset_label(*snap, a.id),
                                           category_label(*snap, a.category_id), format_money(a.cost_per_day)));
    }
    for (const auto& slot : result.unmet) {
        std::cout << theme::fail(fmt::format("{} short by {}", slot.category_name, slot.missing));
        if (!slot.upgrade_path.empty()) {
            std::cout << theme::step("Closest upgrade: " + format_path(*snap, slot.upgrade_path));
        }
    }
    std::cout << "\n";
}

// upgrade <asset_id> <target_asset_id | field=value ...>
static void do_upgrade(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    std::optional<int> source;
    if (!args.positional.empty()) source = parse_id(args.positional[0]);
    if (!source || (args.positional.size() < 2 && args.options.empty())) {
        std::cout << theme::fail("Usage: upgrade <asset_id> <target_asset_id | field=value ...>");
        return;
    }

    UpgradeTarget target;
    if (args.positional.size() >= 2) {
        target.asset_id = parse_id(args.positional[1]);
        if (!target.asset_id) {
            std::cout << theme::fail("Bad target asset id: " + args.positional[1]);
            return;
        }
    } else {
        CapabilityMap want;
        if (!collect_capabilities(args, {}, want)) return;
        target.spec = want;
    }

    auto snap = cli.store->snapshot();
    MatchingEngine engine(*snap, cli.engine_config());
    auto r = engine.upgrade_path(*source, target);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    if (r.value.empty()) {
        std::cout << theme::info("No upgrade path from " + asset_label(*snap, *source));
        return;
    }
    std::cout << theme::ok(fmt::format("{} ({} step{})", format_path(*snap, r.value),
                                       r.value.size() - 1, r.value.size() == 2 ? "" : "s"));
}

void register_matching_commands(BaseCLI& cli) {
    cli.add_command("match", do_match, "Rank assets: <category> [qty=N] [max_cost=X] [field=value]");
    cli.add_command("optimize", do_optimize, "Best asset set for <project> within budget");
    cli.add_command("upgrade", do_upgrade, "Upgrade chain: <asset> <target | field=value>");
}
