#include "helpers.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_ports(BaseCLI& cli, const std::string& arg) {
    std::string user = arg.empty() ? cli.actor : arg;
    if (user != cli.actor && !cli.service.access().is_admin(cli.actor)) {
        std::cout << theme::fail("Only admins can view another user's ports.");
        return;
    }

    PortSummary summary = cli.service.list_ports(user);
    std::cout << theme::kv("Slots", fmt::format("{} used of {}", summary.forwards.size(),
                                                summary.slots));
    if (summary.forwards.empty()) return;

    std::cout << "\n" << theme::color::DIM
              << fmt::format("    {:<8} {:<10} {}\n", "HOST", "INTERNAL", "INSTANCE")
              << theme::color::RESET;
    for (const auto& f : summary.forwards) {
        std::cout << fmt::format("    {:<8} {:<10} {}\n", f.host_port, f.internal_port,
                                 f.instance_id);
    }
    std::cout << "\n";
}

static void do_forward(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 2) {
        std::cout << theme::fail("Usage: forward <instance> <internal_port>");
        return;
    }

    std::string id = cli.resolve_instance((*args)[0]);
    if (id.empty()) return;
    auto port = positive_arg((*args)[1], "internal_port");
    if (!port) return;

    auto r = cli.service.forward_port(cli.actor, id, *port);
    if (!cli.check(r)) return;
    std::cout << theme::ok(fmt::format("Host port {} -> {}:{} (tcp+udp)", r.value.host_port,
                                       id, r.value.internal_port));
}

static void do_release(BaseCLI& cli, const std::string& arg) {
    auto port = positive_arg(arg, "host_port");
    if (!port) return;

    auto r = cli.service.release_port(cli.actor, *port);
    if (!cli.check(r)) return;
    std::cout << theme::ok(fmt::format("Released host port {}", *port));
}

static void do_slots(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (!args) return;
    if (args->size() != 2) {
        std::cout << theme::fail("Usage: slots <user> <amount>");
        return;
    }
    auto amount = positive_arg((*args)[1], "amount");
    if (!amount) return;

    auto r = cli.service.add_port_slots(cli.actor, (*args)[0], *amount);
    if (!cli.check(r)) return;
    std::cout << theme::ok(fmt::format("{} now has {} port slots", (*args)[0], r.value));
}

void register_port_commands(BaseCLI& cli) {
    cli.add_command("ports", do_ports, "Show port slots and forwards");
    cli.add_command("forward", do_forward, "Forward a host port to an instance port");
    cli.add_command("release", do_release, "Remove a port forward");
    cli.add_command("slots", do_slots, "Grant port slots to a user");
}
