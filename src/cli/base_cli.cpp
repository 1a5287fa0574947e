#include "base_cli.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

BaseCLI::BaseCLI(WardenService& service, std::string actor)
    : service(service), actor(std::move(actor)) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

std::string BaseCLI::resolve_instance(const std::string& arg) const {
    if (arg.empty()) {
        std::cout << theme::fail("Missing instance id.");
        return "";
    }

    std::string number = arg[0] == '#' ? arg.substr(1) : arg;
    auto n = parse_int(number);
    if (!n) return arg;

    auto r = service.resolve_number(actor, *n);
    if (!check(r)) return "";
    return r.value;
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Instances",  {"list", "create", "start", "stop", "restart", "delete",
                        "resize", "add", "stats", "ps", "logs", "exec"}},
        {"Confirmed",  {"reinstall", "stopall", "confirm", "cancel"}},
        {"Copies",     {"clone", "migrate", "snapshot", "snapshots", "restore"}},
        {"Governance", {"suspend", "unsuspend", "suspensions", "hostguard",
                        "checkhost", "checkinstances", "fleet"}},
        {"Ports",      {"ports", "forward", "release", "slots"}},
        {"Access",     {"share", "unshare", "admins", "addadmin", "rmadmin", "as", "whoami"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::SLATE
                          << fmt::format("    {:<16}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string who_color = service.access().is_admin(actor) ? theme::color::AMBER
                                                             : theme::color::GREEN;
    return rl_esc(theme::color::SLATE) + "warden"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(who_color) + actor
         + rl_esc(theme::color::RESET) + "> ";
}
