#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_instance_commands(BaseCLI& cli);
void register_copy_commands(BaseCLI& cli);
void register_port_commands(BaseCLI& cli);
void register_admin_commands(BaseCLI& cli);
void register_guardian_commands(BaseCLI& cli);

class WardenCLI : public BaseCLI {
public:
    WardenCLI(WardenService& service, std::string actor);

    // Banner, guardian start-up and the readline loop. Returns on quit or EOF.
    void run_repl();

private:
    void register_all_commands();
};
