#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Defaults, overlaid by ~/.warden/config.yaml (if present), overlaid by
    // environment variables. Values are validated before returning.
    static Result<Config> load(const std::optional<fs::path>& config_file = std::nullopt);

    // Overlay the recognised keys of a YAML document onto this config.
    Result<void> apply_yaml(const std::string& yaml_text);

    // Overlay CPU_THRESHOLD, RAM_THRESHOLD, CHECK_INTERVAL, ... from the environment.
    Result<void> apply_env();

    Result<void> validate() const;

    // Accessors
    const ToolConfig& tool() const { return tool_; }
    const GuardianConfig& guardian() const { return guardian_; }
    const PortRange& ports() const { return ports_; }
    const std::string& main_admin() const { return main_admin_; }
    const fs::path& state_dir() const { return state_dir_; }
    const fs::path& log_file() const { return log_file_; }
    int confirm_ttl() const { return confirm_ttl_; }

    // Mutators for front ends and tests
    ToolConfig& tool() { return tool_; }
    GuardianConfig& guardian() { return guardian_; }
    PortRange& ports() { return ports_; }
    void set_main_admin(const std::string& id) { main_admin_ = id; }
    void set_state_dir(const fs::path& dir) { state_dir_ = dir; }
    void set_log_file(const fs::path& file) { log_file_ = file; }
    void set_confirm_ttl(int secs) { confirm_ttl_ = secs; }

public:
    Config();

private:
    ToolConfig tool_;
    GuardianConfig guardian_;
    PortRange ports_;
    std::string main_admin_;
    fs::path state_dir_;
    fs::path log_file_;
    int confirm_ttl_;
};

// Get paths
fs::path get_config_dir();
fs::path get_default_config_path();
