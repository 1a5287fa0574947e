#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include "instance_store.hpp"
#include "command_executor.hpp"
#include "usage_probe.hpp"

// Live view of one instance. Each field is "unknown" if its probe failed.
struct LiveStats {
    std::string id;
    std::string tool_status;
    std::string cpu;       // "12.5%"
    std::string memory;    // "512/2048 MB (25.0%)"
    std::string disk;      // "3.1G/20G (16%)"
};

struct FleetStats {
    int users = 0;
    int admins = 0;               // main admin plus delegated
    int instances = 0;
    int running = 0;
    int stopped = 0;
    int suspended = 0;
    int total_ram_gb = 0;
    int total_cpu = 0;
    int total_disk_gb = 0;
};

struct AuditEntry {
    std::string instance_id;
    SuspensionEntry entry;
};

// Read-only introspection. Nothing here mutates the store.
class Inspector {
public:
    Inspector(InstanceStore& store, CommandExecutor& exec, UsageProbe& probe);

    Result<LiveStats> live_stats(const std::string& id);
    Result<std::string> processes(const std::string& id);
    Result<std::string> logs(const std::string& id, int lines);

    // Runs through `bash -c`. Output is truncated for display.
    Result<std::string> exec(const std::string& id, const std::string& command);

    FleetStats fleet_stats() const;

    // Newest first. With an id, at most HISTORY_DISPLAY_LIMIT entries.
    Result<std::vector<AuditEntry>> suspension_log(const std::optional<std::string>& id) const;

private:
    Result<void> require(const std::string& id) const;

    InstanceStore& store_;
    CommandExecutor& exec_;
    UsageProbe& probe_;
};
