#include "helpers.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

// ── Listing ──────────────────────────────────────────────────

static void do_list(BaseCLI& cli, const std::string& arg) {
    std::string owner = arg.empty() ? cli.actor : arg;
    auto r = cli.service.list_instances(cli.actor, owner);
    if (!cli.check(r)) return;

    if (r.value.empty()) {
        std::cout << theme::dim("  No instances for " + owner + ".") << "\n";
        return;
    }

    size_t w_id = 2, w_cfg = 6;
    for (const auto& inst : r.value) {
        w_id = std::max(w_id, inst.id.size());
        w_cfg = std::max(w_cfg, inst.config.size());
    }

    std::string hfmt = fmt::format("  {{:<4}} {{:<{}}} {{:<11}} {{:<{}}} {{}}\n", w_id + 2, w_cfg + 2);
    std::cout << "\n" << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "#", "ID", "STATUS", "CONFIG", "POOL")
              << theme::color::RESET;

    int n = 1;
    for (const auto& inst : r.value) {
        std::cout << fmt::format("  {:<4} {:<{}} ", n++, inst.id, w_id + 2)
                  << theme::status(inst.status, 11) << " "
                  << fmt::format("{:<{}} ", inst.config, w_cfg + 2)
                  << theme::dim(inst.pool) << "\n";
    }
    std::cout << "\n";
}

// ── Create / delete ──────────────────────────────────────────

static void do_create(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 4) {
        std::cout << theme::fail("Usage: create <owner> <ram_gb> <cpu> <disk_gb>");
        return;
    }

    auto ram = positive_arg((*args)[1], "ram_gb");
    auto cpu = positive_arg((*args)[2], "cpu");
    auto disk = positive_arg((*args)[3], "disk_gb");
    if (!ram || !cpu || !disk) return;

    std::cout << theme::step("Provisioning for " + (*args)[0] + "...");
    auto r = cli.service.create_instance(cli.actor, (*args)[0], *ram, *cpu, *disk);
    if (!cli.check(r)) return;

    std::cout << theme::ok("Created " + r.value.id);
    std::cout << theme::kv("Config", r.value.config);
    std::cout << theme::kv("Pool", r.value.pool);
}

static void do_delete(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->empty()) {
        std::cout << theme::fail("Usage: delete <instance> [reason...]");
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    std::string reason;
    for (size_t i = 1; i < args->size(); i++) {
        if (i > 1) reason += " ";
        reason += (*args)[i];
    }

    auto r = cli.service.delete_instance(cli.actor, id, reason);
    if (!cli.check(r)) return;
    std::cout << theme::ok("Deleted " + id);
}

// ── Power ────────────────────────────────────────────────────

static void report_status(BaseCLI& cli, const std::string& id, const Result<InstanceStatus>& r) {
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " is " + status_name(r.value));
}

static void do_start(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;
    report_status(cli, id, cli.service.start_instance(cli.actor, id));
}

static void do_stop(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;
    report_status(cli, id, cli.service.stop_instance(cli.actor, id));
}

static void do_restart(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;
    report_status(cli, id, cli.service.restart_instance(cli.actor, id));
}

// ── Resources ────────────────────────────────────────────────

// Parses "ram=8 cpu=4 disk=40" style arguments after the instance id.
static bool parse_resize_args(const std::vector<std::string>& args, ResizeRequest& req) {
    for (size_t i = 1; i < args.size(); i++) {
        auto eq = args[i].find('=');
        if (eq == std::string::npos) {
            std::cout << theme::fail("Expected key=value, got '" + args[i] + "'");
            return false;
        }
        std::string key = args[i].substr(0, eq);
        auto value = positive_arg(args[i].substr(eq + 1), key);
        if (!value) return false;

        if (key == "ram") req.ram_gb = value;
        else if (key == "cpu") req.cpu = value;
        else if (key == "disk") req.disk_gb = value;
        else {
            std::cout << theme::fail("Unknown resource '" + key + "' (use ram, cpu or disk)");
            return false;
        }
    }
    return true;
}

static void run_resize(BaseCLI& cli, const std::string& arg, ResizeRequest::Mode mode,
                       const char* usage) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() < 2) {
        std::cout << theme::fail(usage);
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    ResizeRequest req;
    req.mode = mode;
    if (!parse_resize_args(*args, req)) return;

    std::cout << theme::step("Applying limits to " + id + "...");
    auto r = cli.service.resize_instance(cli.actor, id, req);
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " now has " + r.value.config);
}

static void do_resize(BaseCLI& cli, const std::string& arg) {
    run_resize(cli, arg, ResizeRequest::Mode::Absolute,
               "Usage: resize <instance> [ram=GB] [cpu=N] [disk=GB]");
}

static void do_add(BaseCLI& cli, const std::string& arg) {
    run_resize(cli, arg, ResizeRequest::Mode::Add,
               "Usage: add <instance> [ram=GB] [cpu=N] [disk=GB]");
}

// ── Confirmed actions ────────────────────────────────────────

static void do_reinstall(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;

    auto r = cli.service.request_reinstall(cli.actor, id);
    if (!cli.check(r)) return;
    std::cout << theme::info("Reinstalling wipes every file on " + id + ".");
    print_pending(r.value, cli.service.config().confirm_ttl());
}

static void do_stopall(BaseCLI& cli, const std::string& arg) {
    auto r = cli.service.request_stop_all(cli.actor);
    if (!cli.check(r)) return;
    print_pending(r.value, cli.service.config().confirm_ttl());
}

static void do_confirm(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: confirm <handle>");
        return;
    }
    std::cout << theme::step("Running confirmed action...");
    auto r = cli.service.confirm(cli.actor, arg);
    if (!cli.check(r)) return;
    std::cout << theme::ok(r.value);
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: cancel <handle>");
        return;
    }
    auto r = cli.service.cancel(cli.actor, arg);
    if (!cli.check(r)) return;
    std::cout << theme::ok("Canceled.");
}

// ── Inspection ───────────────────────────────────────────────

static void do_stats(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;

    auto r = cli.service.live_stats(cli.actor, id);
    if (!cli.check(r)) return;

    std::cout << theme::section(id);
    std::cout << theme::kv("Tool status", r.value.tool_status);
    std::cout << theme::kv("CPU", r.value.cpu);
    std::cout << theme::kv("Memory", r.value.memory);
    std::cout << theme::kv("Disk", r.value.disk);

    auto found = cli.service.store().find(id);
    if (found) {
        const Instance& inst = found->instance;
        std::cout << theme::kv("Owner", found->owner);
        std::cout << theme::kv("Config", inst.config);
        std::cout << theme::kv("Created", format_timestamp(inst.created_at)
                               + theme::dim(" (" + format_duration(inst.created_at) + " ago)"));
        std::cout << theme::kv("Record", status_name(inst.status));
        if (!inst.shared_with.empty()) {
            std::string shared;
            for (const auto& u : inst.shared_with) shared += (shared.empty() ? "" : ", ") + u;
            std::cout << theme::kv("Shared", shared);
        }
    }
    std::cout << "\n";
}

static void print_block(const std::string& text) {
    std::cout << "\n" << text << "\n\n";
}

static void do_ps(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;
    auto r = cli.service.processes(cli.actor, id);
    if (!cli.check(r)) return;
    print_block(r.value);
}

static void do_logs(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->empty() || args->size() > 2) {
        std::cout << theme::fail("Usage: logs <instance> [lines]");
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    int lines = 50;
    if (args->size() == 2) {
        auto n = positive_arg((*args)[1], "lines");
        if (!n) return;
        lines = *n;
    }

    auto r = cli.service.logs(cli.actor, id, lines);
    if (!cli.check(r)) return;
    print_block(r.value);
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    auto space = arg.find(' ');
    if (space == std::string::npos) {
        std::cout << theme::fail("Usage: exec <instance> <command...>");
        return;
    }

    std::string id = cli.resolve_instance(arg.substr(0, space));
    if (id.empty()) return;

    std::string command = arg.substr(space + 1);
    trim(command);
    auto r = cli.service.exec_in(cli.actor, id, command);
    if (!cli.check(r)) return;
    print_block(r.value);
}

void register_instance_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "List instances (yours, or an owner's)");
    cli.add_command("create", do_create, "Create an instance for an owner");
    cli.add_command("delete", do_delete, "Delete an instance");
    cli.add_command("start", do_start, "Start an instance");
    cli.add_command("stop", do_stop, "Stop an instance");
    cli.add_command("restart", do_restart, "Restart an instance");
    cli.add_command("resize", do_resize, "Set ram/cpu/disk to new values");
    cli.add_command("add", do_add, "Add ram/cpu/disk to an instance");
    cli.add_command("reinstall", do_reinstall, "Request a reinstall (needs confirm)");
    cli.add_command("stopall", do_stopall, "Request a fleet-wide stop (needs confirm)");
    cli.add_command("confirm", do_confirm, "Confirm a pending action");
    cli.add_command("cancel", do_cancel, "Cancel a pending action");
    cli.add_command("stats", do_stats, "Live status and usage of an instance");
    cli.add_command("ps", do_ps, "Process list inside an instance");
    cli.add_command("logs", do_logs, "Tail the instance syslog");
    cli.add_command("exec", do_exec, "Run a command inside an instance");
}
