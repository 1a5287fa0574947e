#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include "command_executor.hpp"

struct MemoryUsage {
    long total_mb = 0;
    long used_mb = 0;

    double percent() const {
        return total_mb > 0 ? static_cast<double>(used_mb) * 100.0 / total_mb : 0.0;
    }
};

struct DiskUsage {
    std::string size;      // as printed by df -h, e.g. "20G"
    std::string used;
    std::string percent;   // e.g. "37%"
};

struct InstanceUsage {
    double cpu_percent = 0.0;
    double ram_percent = 0.0;
};

// ── Parsers for raw command output ──────────────────────────

// 100 minus the idle figure on the "%Cpu(s):" line of `top -bn1`.
std::optional<double> parse_top_cpu(const std::string& top_output);

// Total and used MB from the "Mem:" row of `free -m`.
std::optional<MemoryUsage> parse_free_memory(const std::string& free_output);

// Size/used/percent of the row mounted on "/" in `df -h /`.
std::optional<DiskUsage> parse_df_root(const std::string& df_output);

// Value of the "Status:" line of `lxc info <id>`.
std::optional<std::string> parse_info_status(const std::string& info_output);

// Samples load on the host and inside instances through the executor.
class UsageProbe {
public:
    explicit UsageProbe(CommandExecutor& exec);
    Result<double> host_cpu();
    Result<InstanceUsage> instance_usage(const std::string& id);

    Result<double> instance_cpu(const std::string& id);
    Result<MemoryUsage> instance_memory(const std::string& id);
    Result<DiskUsage> instance_disk(const std::string& id);
    Result<std::string> tool_status(const std::string& id);

private:
    CommandExecutor& exec_;
};
