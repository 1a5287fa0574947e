#include "helpers.hpp"
#include <iostream>

static void do_clone(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->empty() || args->size() > 2) {
        std::cout << theme::fail("Usage: clone <instance> [new_id]");
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    std::cout << theme::step("Copying " + id + "...");
    auto r = cli.service.clone_instance(cli.actor, id, args->size() == 2 ? (*args)[1] : "");
    if (!cli.check(r)) return;
    std::cout << theme::ok("Cloned to " + r.value.id);
}

static void do_migrate(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 2) {
        std::cout << theme::fail("Usage: migrate <instance> <pool>");
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    std::cout << theme::step("Moving " + id + " to pool " + (*args)[1] + "...");
    auto r = cli.service.migrate_instance(cli.actor, id, (*args)[1]);
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " now lives on " + r.value.pool);
}

static void do_snapshot(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;

    auto r = cli.service.snapshot_instance(cli.actor, id);
    if (!cli.check(r)) return;
    std::cout << theme::ok("Snapshot " + r.value);
}

static void do_snapshots(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;

    auto r = cli.service.list_snapshots(cli.actor, id);
    if (!cli.check(r)) return;
    if (r.value.empty()) {
        std::cout << theme::dim("  No snapshots of " + id + ".") << "\n";
        return;
    }
    std::cout << "\n";
    for (const auto& name : r.value) {
        std::cout << "    " << name << "\n";
    }
    std::cout << "\n";
}

static void do_restore(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 2) {
        std::cout << theme::fail("Usage: restore <instance> <snapshot>");
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;

    auto r = cli.service.restore_instance(cli.actor, id, (*args)[1]);
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " restored from " + (*args)[1]);
}

void register_copy_commands(BaseCLI& cli) {
    cli.add_command("clone", do_clone, "Copy an instance for the same owner");
    cli.add_command("migrate", do_migrate, "Move an instance to another storage pool");
    cli.add_command("snapshot", do_snapshot, "Take a snapshot");
    cli.add_command("snapshots", do_snapshots, "List snapshots of an instance");
    cli.add_command("restore", do_restore, "Restore an instance from a snapshot");
}
