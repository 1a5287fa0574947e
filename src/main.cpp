#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include <filesystem>
#include "cli/warden_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <managers/warden_service.hpp>

void print_usage() {
    std::cout << theme::banner(WARDEN_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::SLATE << "    warden"
              << theme::color::RESET << theme::color::DIM
              << "                       Start guardians and enter the console"
              << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    warden --as "
              << theme::color::RESET << theme::color::AMBER << "<user>"
              << theme::color::RESET << theme::color::DIM
              << "           Act as a user (default: main admin)"
              << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    warden --config "
              << theme::color::RESET << theme::color::AMBER << "<file>"
              << theme::color::RESET << theme::color::DIM
              << "       Use a config file other than ~/.warden/config.yaml"
              << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    warden --version             Show version\n"
              << "    warden --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::optional<std::filesystem::path> config_path;
        std::string actor;

        std::vector<std::string> args(argv + 1, argv + argc);
        for (size_t i = 0; i < args.size(); i++) {
            const std::string& arg = args[i];
            if (arg == "--version") {
                std::cout << theme::color::AMBER << theme::color::BOLD << "warden"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << WARDEN_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            } else if ((arg == "--as" || arg == "--config") && i + 1 < args.size()) {
                if (arg == "--as") actor = args[++i];
                else config_path = args[++i];
            } else {
                std::cout << theme::fail("Unknown or incomplete argument: " + arg);
                print_usage();
                return 1;
            }
        }

        auto config = Config::load(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.describe());
            return 1;
        }
        if (config.value.main_admin().empty()) {
            std::cout << theme::fail("No main admin configured.");
            std::cout << theme::step("Set main_admin in the config file or MAIN_ADMIN_ID.");
            return 1;
        }
        if (actor.empty()) actor = config.value.main_admin();

        WardenService service(config.value);
        auto opened = service.open();
        if (opened.is_err()) {
            std::cout << theme::fail(opened.describe());
            return 1;
        }

        WardenCLI cli(service, actor);
        cli.run_repl();
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
