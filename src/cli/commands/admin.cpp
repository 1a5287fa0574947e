#include "helpers.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <optional>
#include <fmt/format.h>

// ── Sharing ──────────────────────────────────────────────────

static void do_share(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 2) {
        std::cout << theme::fail("Usage: share <instance> <user>");
        return;
    }
    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    auto r = cli.service.share_instance(cli.actor, id, (*args)[1]);
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " shared with " + (*args)[1]);
}

static void do_unshare(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 2) {
        std::cout << theme::fail("Usage: unshare <instance> <user>");
        return;
    }
    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    auto r = cli.service.revoke_share(cli.actor, id, (*args)[1]);
    if (!cli.check(r)) return;
    std::cout << theme::ok((*args)[1] + " no longer has access to " + id);
}

// ── Admins ───────────────────────────────────────────────────

static void do_admins(BaseCLI& cli, const std::string& arg) {
    AdminRegistry reg = cli.service.admins();
    std::cout << theme::kv("Main admin", reg.main_admin.empty() ? theme::dim("(unset)")
                                                                : reg.main_admin);
    if (reg.admins.empty()) {
        std::cout << theme::kv("Admins", theme::dim("none"));
        return;
    }
    for (size_t i = 0; i < reg.admins.size(); i++) {
        std::cout << theme::kv(i == 0 ? "Admins" : "", reg.admins[i]);
    }
}

static void do_addadmin(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: addadmin <user>");
        return;
    }
    auto r = cli.service.add_admin(cli.actor, arg);
    if (!cli.check(r)) return;
    std::cout << theme::ok(arg + " is now an admin");
}

static void do_rmadmin(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: rmadmin <user>");
        return;
    }
    auto r = cli.service.remove_admin(cli.actor, arg);
    if (!cli.check(r)) return;
    std::cout << theme::ok(arg + " is no longer an admin");
}

// ── Fleet ────────────────────────────────────────────────────

static void do_fleet(BaseCLI& cli, const std::string& arg) {
    auto r = cli.service.fleet_stats(cli.actor);
    if (!cli.check(r)) return;

    const FleetStats& s = r.value;
    std::cout << theme::section("Fleet");
    std::cout << theme::kv("Users", std::to_string(s.users));
    std::cout << theme::kv("Admins", std::to_string(s.admins));
    std::cout << theme::kv("Instances", fmt::format("{} ({} running, {} stopped, {} suspended)",
                                                    s.instances, s.running, s.stopped,
                                                    s.suspended));
    std::cout << theme::kv("Allotted", fmt::format("{}GB RAM / {} CPU / {}GB Disk",
                                                   s.total_ram_gb, s.total_cpu,
                                                   s.total_disk_gb));
    std::cout << "\n";
}

static void do_suspensions(BaseCLI& cli, const std::string& arg) {
    std::optional<std::string> id;
    if (!arg.empty()) {
        std::string resolved = cli.resolve_instance(arg);
        if (resolved.empty()) return;
        id = resolved;
    }

    auto r = cli.service.suspension_log(cli.actor, id);
    if (!cli.check(r)) return;
    if (r.value.empty()) {
        std::cout << theme::dim("  No suspensions recorded.") << "\n";
        return;
    }

    std::cout << "\n";
    for (const auto& a : r.value) {
        std::cout << "    " << theme::dim(format_timestamp(a.entry.time)) << "  "
                  << (id ? "" : a.instance_id + "  ")
                  << a.entry.reason
                  << theme::dim("  by " + a.entry.actor) << "\n";
    }
    std::cout << "\n";
}

void register_admin_commands(BaseCLI& cli) {
    cli.add_command("share", do_share, "Let another user operate an instance");
    cli.add_command("unshare", do_unshare, "Revoke a share");
    cli.add_command("admins", do_admins, "Show the admin registry");
    cli.add_command("addadmin", do_addadmin, "Delegate admin rights (main admin only)");
    cli.add_command("rmadmin", do_rmadmin, "Revoke admin rights (main admin only)");
    cli.add_command("fleet", do_fleet, "Fleet-wide counts and allotments");
    cli.add_command("suspensions", do_suspensions, "Suspension audit trail");
}
