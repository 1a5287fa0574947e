#pragma once

#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/confirmation_registry.hpp>
#include <optional>
#include <string>
#include <vector>

// Split a command's argument string with shell quoting. Prints the error
// and returns nullopt on an unterminated quote.
inline std::optional<std::vector<std::string>> split_args(const std::string& arg) {
    auto words = split_command_line(arg);
    if (!words) {
        std::cout << theme::fail("Unterminated quote in arguments.");
    }
    return words;
}

// Parse a positive integer argument, printing a failure naming `what`.
inline std::optional<int> positive_arg(const std::string& text, const std::string& what) {
    auto v = parse_int(text);
    if (!v || *v <= 0) {
        std::cout << theme::fail(what + " must be a positive integer (got '" + text + "')");
        return std::nullopt;
    }
    return v;
}

inline void print_pending(const PendingConfirmation& pending, int ttl_secs) {
    std::cout << theme::info(std::string(pending_action_name(pending.action))
                             + (pending.target.empty() ? "" : " of " + pending.target)
                             + " is waiting for confirmation.");
    std::cout << theme::step(fmt::format("Run 'confirm {}' within {}s, or 'cancel {}'.",
                                         pending.handle, ttl_secs, pending.handle));
}
