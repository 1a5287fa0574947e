#pragma once

#include <string>
#include <map>
#include <functional>
#include <iostream>
#include <managers/warden_service.hpp>
#include "theme.hpp"

class BaseCLI {
public:
    BaseCLI(WardenService& service, std::string actor);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Instance argument: a full id, or "#N" / "N" for the acting user's
    // N-th instance. Prints the failure and returns "" when unresolvable.
    std::string resolve_instance(const std::string& arg) const;

    // Print a failed result. Returns true when the result is ok.
    template<typename T>
    bool check(const Result<T>& r) const {
        if (r.is_ok()) return true;
        std::cout << theme::fail(r.describe());
        return false;
    }

    std::string get_prompt_string() const;

    WardenService& service;
    std::string actor;      // user id every command acts as
    bool quit_requested = false;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
