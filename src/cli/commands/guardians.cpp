#include "helpers.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_suspend(BaseCLI& cli, const std::string& arg) {
    auto space = arg.find(' ');
    std::string id = cli.resolve_instance(arg.substr(0, space));
    if (id.empty()) return;

    std::string reason = space == std::string::npos ? "" : arg.substr(space + 1);
    trim(reason);

    auto r = cli.service.suspend_instance(cli.actor, id, reason);
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " suspended");
}

static void do_unsuspend(BaseCLI& cli, const std::string& arg) {
    std::string id = cli.resolve_instance(arg);
    if (id.empty()) return;

    auto r = cli.service.unsuspend_instance(cli.actor, id);
    if (!cli.check(r)) return;
    std::cout << theme::ok(id + " unsuspended and running");
}

static void do_hostguard(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::kv("Host guard", cli.service.host_guardian().enabled()
                                             ? theme::green("enabled")
                                             : theme::yellow("disabled"));
        return;
    }
    if (arg != "on" && arg != "off") {
        std::cout << theme::fail("Usage: hostguard [on|off]");
        return;
    }

    auto r = cli.service.set_host_guardian(cli.actor, arg == "on");
    if (!cli.check(r)) return;
    std::cout << theme::ok(std::string("Host guardian ") + (arg == "on" ? "enabled" : "disabled"));
}

static void do_checkhost(BaseCLI& cli, const std::string& arg) {
    auto r = cli.service.check_host_now(cli.actor);
    if (!cli.check(r)) return;

    const auto& t = r.value;
    if (!t.cpu) {
        std::cout << theme::fail("Host CPU could not be sampled (see log).");
        return;
    }
    std::cout << theme::kv("Host CPU", fmt::format("{:.1f}%", *t.cpu));
    if (!t.breached) {
        std::cout << theme::ok("Below threshold");
    } else if (t.enforced) {
        std::cout << theme::info(fmt::format("Threshold breached, {} instances stopped", t.stopped));
    } else {
        std::cout << theme::fail("Threshold breached, stop-all not enforced (see log)");
    }
}

static void do_checkinstances(BaseCLI& cli, const std::string& arg) {
    auto r = cli.service.check_instances_now(cli.actor);
    if (!cli.check(r)) return;

    const auto& t = r.value;
    std::cout << theme::kv("Checked", std::to_string(t.checked));
    if (t.failures > 0) {
        std::cout << theme::kv("Failures", theme::yellow(std::to_string(t.failures)));
    }
    for (const auto& id : t.suspended) {
        std::cout << theme::info(id + " suspended");
    }
    if (t.suspended.empty()) {
        std::cout << theme::ok("No instance over its limits");
    }
}

void register_guardian_commands(BaseCLI& cli) {
    cli.add_command("suspend", do_suspend, "Suspend an instance [reason...]");
    cli.add_command("unsuspend", do_unsuspend, "Lift a suspension and start the instance");
    cli.add_command("hostguard", do_hostguard, "Show or toggle the host guardian");
    cli.add_command("checkhost", do_checkhost, "Sample host CPU now");
    cli.add_command("checkinstances", do_checkinstances, "Run one instance-guardian pass now");
}
