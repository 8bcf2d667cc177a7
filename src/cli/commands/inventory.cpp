#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static std::string status_colored(AssetStatus s) {
    std::string text = to_string(s);
    switch (s) {
        case AssetStatus::Available:   return theme::color::GREEN + text + theme::color::RESET;
        case AssetStatus::InUse:       return theme::color::YELLOW + text + theme::color::RESET;
        case AssetStatus::Maintenance: return theme::color::RED + text + theme::color::RESET;
        case AssetStatus::Retired:     return theme::color::DIM + text + theme::color::RESET;
    }
    return text;
}

static void do_load(BaseCLI& cli, const std::string& arg) {
    std::string path = arg;
    trim(path);
    if (path.empty()) {
        path = cli.config ? cli.config->snapshot_path() : DEFAULT_SNAPSHOT_FILE;
    }

    auto r = cli.open_snapshot(path);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    auto snap = cli.store->snapshot();
    std::cout << theme::ok(fmt::format("Loaded {} ({} assets, {} projects, {} allocations)",
                                       path, snap->list_assets().size(), snap->list_projects().size(),
                                       snap->list_allocations().size()));
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto snap = cli.store->snapshot();

    auto assets = snap->list_assets();
    int available = 0, in_use = 0, maintenance = 0, retired = 0;
    for (const auto& a : assets) {
        switch (a.status) {
            case AssetStatus::Available:   available++; break;
            case AssetStatus::InUse:       in_use++; break;
            case AssetStatus::Maintenance: maintenance++; break;
            case AssetStatus::Retired:     retired++; break;
        }
    }

    std::cout << theme::section("Snapshot");
    std::cout << theme::kv("File", cli.snapshot_file);
    std::cout << theme::kv("As of", format_timestamp(snap->as_of()));
    std::cout << theme::kv("Revision", std::to_string(snap->revision()));
    std::cout << theme::kv("Categories", std::to_string(snap->list_categories().size()));
    std::cout << theme::kv("Teams", std::to_string(snap->list_teams().size()));
    std::cout << theme::kv("Projects", std::to_string(snap->list_projects().size()));
    std::cout << theme::kv("Assets", fmt::format("{} ({} available, {} in use, {} maintenance, {} retired)",
                                                 assets.size(), available, in_use, maintenance, retired));
    std::cout << theme::kv("Active allocs", std::to_string(cli.store->active_allocations().size()));
    std::cout << "\n";
}

// assets [category_id] [status=available]
static void do_assets(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto snap = cli.store->snapshot();
    auto args = parse_args(arg);

    AssetFilter filter;
    if (!args.positional.empty()) {
        auto id = parse_id(args.positional[0]);
        if (!id) {
            std::cout << theme::fail("Usage: assets [category_id] [status=<status>]");
            return;
        }
        filter.category_id = *id;
    }
    if (args.has("status")) {
        auto s = parse_asset_status(args.get("status"));
        if (!s) {
            std::cout << theme::fail("Unknown status: " + args.get("status"));
            return;
        }
        filter.statuses.push_back(*s);
    }

    auto assets = snap->list_assets(filter);
    if (assets.empty()) {
        std::cout << theme::dim("  No matching assets.") << "\n";
        return;
    }

    size_t w_name = 4, w_cat = 8;
    for (const auto& a : assets) {
        w_name = std::max(w_name, a.name.size());
        w_cat = std::max(w_cat, category_label(*snap, a.category_id).size());
    }

    std::string hfmt = fmt::format("  {{:>5}}  {{:<{}}} {{:<{}}} {{:<12}} {{:>10}} {{:>6}}  {{}}\n",
                                   w_name + 2, w_cat + 2);
    std::cout << "\n" << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "ID", "NAME", "CATEGORY", "STATUS", "COST/DAY", "UTIL", "SPEC")
              << theme::color::RESET;

    for (const auto& a : assets) {
        std::string row = fmt::format(fmt::runtime(fmt::format("  {{:>5}}  {{:<{}}} {{:<{}}} ", w_name + 2, w_cat + 2)),
                                      a.id, a.name, category_label(*snap, a.category_id));
        std::string status = to_string(a.status);
        std::cout << row << status_colored(a.status)
                  << std::string(13 - std::min<size_t>(status.size(), 12), ' ')
                  << fmt::format("{:>10} {:>5.0f}%  ", format_money(a.cost_per_day), a.utilization_rate)
                  << theme::dim(format_capabilities(a.specification)) << "\n";
    }
    std::cout << "\n";
}

static void do_allocs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto snap = cli.store->snapshot();

    auto active = cli.store->active_allocations();
    if (active.empty()) {
        std::cout << theme::dim("  No active allocations.") << "\n";
        return;
    }

    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:>5}  {:<24} {:<18} {:<20} {}\n", "ID", "ASSET", "TEAM", "PROJECT", "HELD")
              << theme::color::RESET;
    for (const auto& al : active) {
        std::string project = "-";
        if (al.project_id) {
            const Project* p = snap->find_project(*al.project_id);
            project = p ? p->name : fmt::format("#{}", *al.project_id);
        }
        std::cout << fmt::format("  {:>5}  {:<24} {:<18} {:<20} {}\n",
                                 al.id, asset_label(*snap, al.asset_id), team_label(*snap, al.team_id),
                                 project, format_duration(al.allocated_at, snap->as_of()));
    }
    std::cout << "\n";
}

// allocate <asset_id> <team_id> [project_id]
static void do_allocate(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    if (args.positional.size() < 2) {
        std::cout << theme::fail("Usage: allocate <asset_id> <team_id> [project_id]");
        return;
    }
    auto asset_id = parse_id(args.positional[0]);
    auto team_id = parse_id(args.positional[1]);
    std::optional<int> project_id;
    if (args.positional.size() >= 3) {
        project_id = parse_id(args.positional[2]);
        if (!project_id) {
            std::cout << theme::fail("Bad project id: " + args.positional[2]);
            return;
        }
    }
    if (!asset_id || !team_id) {
        std::cout << theme::fail("Asset and team ids must be numbers.");
        return;
    }

    // The shell decides on the state it just read
    uint64_t seen = cli.store->revision();
    auto r = cli.store->allocate(*asset_id, *team_id, project_id, seen);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    auto snap = cli.store->snapshot();
    std::cout << theme::ok(fmt::format("Allocation {}: {} -> {}", r.value.id,
                                       asset_label(*snap, r.value.asset_id), team_label(*snap, r.value.team_id)));
}

// release <allocation_id> [hours]
static void do_release(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    auto args = parse_args(arg);
    if (args.positional.empty()) {
        std::cout << theme::fail("Usage: release <allocation_id> [hours_used]");
        return;
    }
    auto alloc_id = parse_id(args.positional[0]);
    if (!alloc_id) {
        std::cout << theme::fail("Bad allocation id: " + args.positional[0]);
        return;
    }
    double hours = 0.0;
    if (args.positional.size() >= 2) {
        hours = safe_stod(args.positional[1], -1.0);
        if (hours < 0.0) {
            std::cout << theme::fail("hours_used must be a non-negative number");
            return;
        }
    }

    auto r = cli.store->release(*alloc_id, hours);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    auto snap = cli.store->snapshot();
    std::cout << theme::ok(fmt::format("Released {} ({:.1f} h)", asset_label(*snap, r.value.asset_id), hours));
}

static void do_save(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_snapshot()) return;
    std::string path = arg;
    trim(path);
    if (path.empty()) path = cli.snapshot_file;

    auto r = cli.store->save(path);
    if (r.is_err()) {
        print_error(r.error, r.code);
        return;
    }
    std::cout << theme::ok(fmt::format("Saved revision {} to {}", cli.store->revision(), path));
}

void register_inventory_commands(BaseCLI& cli) {
    cli.add_command("load", do_load, "Load a snapshot file (default from config)");
    cli.add_command("status", do_status, "Snapshot summary");
    cli.add_command("assets", do_assets, "List assets [category_id] [status=..]");
    cli.add_command("allocs", do_allocs, "List active allocations");
    cli.add_command("allocate", do_allocate, "Allocate <asset> <team> [project]");
    cli.add_command("release", do_release, "Release <allocation> [hours_used]");
    cli.add_command("save", do_save, "Write the snapshot back to YAML [path]");
}
