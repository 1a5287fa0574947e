#include "warden_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

WardenCLI::WardenCLI(WardenService& service, std::string actor)
    : BaseCLI(service, std::move(actor)) {
    register_all_commands();
}

void WardenCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    auto quit = [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Stopping guardians...") << "\n";
        cli.quit_requested = true;
    };
    add_command("quit", quit, "Exit the console");
    add_command("exit", quit, "Exit the console");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    add_command("whoami", [](BaseCLI& cli, const std::string& arg) {
        std::string role = cli.service.access().is_main_admin(cli.actor) ? "main admin"
                         : cli.service.access().is_admin(cli.actor)      ? "admin"
                                                                         : "user";
        std::cout << theme::kv("Acting as", cli.actor + theme::dim(" (" + role + ")"));
    }, "Show the acting user");

    add_command("as", [](BaseCLI& cli, const std::string& arg) {
        if (arg.empty()) {
            std::cout << theme::fail("Usage: as <user>");
            return;
        }
        cli.actor = arg;
        std::cout << theme::ok("Now acting as " + arg);
    }, "Act as another user id");

    register_instance_commands(*this);
    register_copy_commands(*this);
    register_port_commands(*this);
    register_admin_commands(*this);
    register_guardian_commands(*this);
}

void WardenCLI::run_repl() {
    std::cout << theme::banner(WARDEN_VERSION);

    const Config& config = service.config();
    std::cout << theme::section("Engine");
    std::cout << theme::kv("Tool", config.tool().tool);
    std::cout << theme::kv("Pool", config.tool().storage_pool);
    std::cout << theme::kv("State", config.state_dir().string());
    std::cout << theme::kv("Log", config.log_file().string());
    std::cout << theme::kv("Thresholds", fmt::format("CPU {}%  RAM {}%",
                                                     config.guardian().cpu_threshold,
                                                     config.guardian().ram_threshold));

    service.start_guardians();
    std::cout << theme::ok(fmt::format("Host guardian every {}s ({})",
        config.guardian().host_check_interval,
        service.host_guardian().enabled() ? "enabled" : "disabled"));
    std::cout << theme::ok(fmt::format("Instance guardian every {}s",
        config.guardian().instance_check_interval));

    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        trim(args);

        execute_command(command, args);
    }

    service.stop_guardians();
}
