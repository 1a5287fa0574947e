#pragma once

#include <string>
#include <fmt/format.h>
#include <core/instance_status.hpp>

namespace theme {

// Console palette (ANSI escape sequences)
// Slate: #4A7BA7
// Amber: #B8862E
namespace color {
    const std::string SLATE     = "\033[38;2;74;123;167m";
    const std::string AMBER     = "\033[38;2;184;134;46m";
    const std::string WHITE     = "\033[97m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }
inline std::string white(const std::string& s)   { return color::WHITE + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner(const std::string& version) {
    return "\n" + color::SLATE + color::BOLD
        + "  Warden Instance Console\n"
        + color::RESET + color::DIM + "  v" + version
        + color::RESET + "\n\n"
        + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::SLATE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// Status word padded to width, colored by state
inline std::string status(InstanceStatus s, size_t width = 0) {
    std::string word = status_name(s);
    std::string pad = word.size() < width ? std::string(width - word.size(), ' ') : "";
    switch (s) {
        case InstanceStatus::Running:   return green(word) + pad;
        case InstanceStatus::Suspended: return red(word) + pad;
        case InstanceStatus::Stopped:   break;
    }
    return dim(word) + pad;
}

} // namespace theme
