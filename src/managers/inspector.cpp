#include "inspector.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

Inspector::Inspector(InstanceStore& store, CommandExecutor& exec, UsageProbe& probe)
    : store_(store), exec_(exec), probe_(probe) {}

Result<void> Inspector::require(const std::string& id) const {
    if (!store_.exists(id)) {
        return Result<void>::Err(ErrorKind::NotFound, fmt::format("instance '{}' not found", id));
    }
    return Result<void>::Ok();
}

Result<LiveStats> Inspector::live_stats(const std::string& id) {
    auto known = require(id);
    if (known.is_err()) return Result<LiveStats>::Fail(known);

    LiveStats stats;
    stats.id = id;

    auto status = probe_.tool_status(id);
    stats.tool_status = status.is_ok() ? status.value : "unknown";

    auto cpu = probe_.instance_cpu(id);
    stats.cpu = cpu.is_ok() ? fmt::format("{:.1f}%", cpu.value) : "unknown";

    auto mem = probe_.instance_memory(id);
    stats.memory = mem.is_ok()
        ? fmt::format("{}/{} MB ({:.1f}%)", mem.value.used_mb, mem.value.total_mb, mem.value.percent())
        : "unknown";

    auto disk = probe_.instance_disk(id);
    stats.disk = disk.is_ok()
        ? fmt::format("{}/{} ({})", disk.value.used, disk.value.size, disk.value.percent)
        : "unknown";

    return Result<LiveStats>::Ok(stats);
}

Result<std::string> Inspector::processes(const std::string& id) {
    auto known = require(id);
    if (known.is_err()) return Result<std::string>::Fail(known);
    return exec_.execute(fmt::format("lxc exec {} -- ps aux", id), PROBE_TIMEOUT_SECS);
}

Result<std::string> Inspector::logs(const std::string& id, int lines) {
    if (lines < 1 || lines > MAX_LOG_TAIL_LINES) {
        return Result<std::string>::Err(ErrorKind::Validation,
            fmt::format("lines must be between 1 and {}", MAX_LOG_TAIL_LINES));
    }
    auto known = require(id);
    if (known.is_err()) return Result<std::string>::Fail(known);
    return exec_.execute(fmt::format("lxc exec {} -- tail -n {} /var/log/syslog", id, lines),
                         PROBE_TIMEOUT_SECS);
}

Result<std::string> Inspector::exec(const std::string& id, const std::string& command) {
    if (command.empty()) {
        return Result<std::string>::Err(ErrorKind::Validation, "command must not be empty");
    }
    auto known = require(id);
    if (known.is_err()) return Result<std::string>::Fail(known);

    auto r = exec_.execute(fmt::format("lxc exec {} -- bash -c {}", id, shell_quote(command)));
    if (r.is_err()) return r;
    return Result<std::string>::Ok(truncate_text(r.value, EXEC_OUTPUT_DISPLAY_LIMIT));
}

FleetStats Inspector::fleet_stats() const {
    return store_.mutate([](FleetState& s) {
        FleetStats stats;
        stats.users = static_cast<int>(s.instances.size());
        stats.admins = static_cast<int>(s.admins.admins.size()) +
                       (s.admins.main_admin.empty() ? 0 : 1);
        for (const auto& [owner, list] : s.instances) {
            for (const auto& inst : list) {
                stats.instances++;
                switch (inst.status) {
                    case InstanceStatus::Running:   stats.running++; break;
                    case InstanceStatus::Stopped:   stats.stopped++; break;
                    case InstanceStatus::Suspended: stats.suspended++; break;
                }
                stats.total_ram_gb += inst.resources.ram_gb;
                stats.total_cpu += inst.resources.cpu;
                stats.total_disk_gb += inst.resources.disk_gb;
            }
        }
        return stats;
    });
}

Result<std::vector<AuditEntry>> Inspector::suspension_log(
        const std::optional<std::string>& id) const {
    using R = Result<std::vector<AuditEntry>>;
    if (id) {
        auto known = require(*id);
        if (known.is_err()) return R::Fail(known);
    }

    std::vector<AuditEntry> entries = store_.mutate([&](FleetState& s) {
        std::vector<AuditEntry> out;
        for (const auto& [owner, list] : s.instances) {
            for (const auto& inst : list) {
                if (id && inst.id != *id) continue;
                for (const auto& e : inst.suspension_history) {
                    out.push_back({inst.id, e});
                }
            }
        }
        return out;
    });

    // ISO timestamps sort lexicographically
    std::stable_sort(entries.begin(), entries.end(),
                     [](const AuditEntry& a, const AuditEntry& b) {
                         return a.entry.time > b.entry.time;
                     });
    if (id && entries.size() > static_cast<size_t>(HISTORY_DISPLAY_LIMIT)) {
        entries.resize(HISTORY_DISPLAY_LIMIT);
    }
    return R::Ok(entries);
}
