#include "instance_guardian.hpp"
#include "log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// ── Construction / Destruction ──────────────────────────────

InstanceGuardian::InstanceGuardian(InstanceStore& store, CommandExecutor& exec,
                                   UsageProbe& probe, OwnerNotifier* notifier,
                                   const GuardianConfig& config)
    : store_(store), exec_(exec), probe_(probe), notifier_(notifier),
      cpu_threshold_(config.cpu_threshold),
      ram_threshold_(config.ram_threshold),
      interval_secs_(config.instance_check_interval) {}

InstanceGuardian::~InstanceGuardian() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool InstanceGuardian::start() {
    if (running_) return true;
    stopping_ = false;
    running_ = true;
    thread_ = std::thread(&InstanceGuardian::guardian_loop, this);
    warden_log(fmt::format("instance_guardian: started (cpu {}%, ram {}%, every {}s)",
                           cpu_threshold_, ram_threshold_, interval_secs_));
    return true;
}

void InstanceGuardian::stop() {
    if (!running_) return;
    stopping_ = true;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    stopping_ = false;
    warden_log("instance_guardian: stopped");
}

// ── Enforcement ─────────────────────────────────────────────

std::string InstanceGuardian::breach_reason(const InstanceUsage& usage) const {
    bool cpu = usage.cpu_percent > cpu_threshold_;
    bool ram = usage.ram_percent > ram_threshold_;
    if (!cpu && !ram) return "";

    std::string metric = cpu && ram ? "CPU and RAM" : (cpu ? "CPU" : "RAM");
    return fmt::format("{} exceeded (CPU {:.1f}%, RAM {:.1f}%; limits {}% / {}%)",
                       metric, usage.cpu_percent, usage.ram_percent,
                       cpu_threshold_, ram_threshold_);
}

Result<bool> InstanceGuardian::handle_breach(const std::string& id, const std::string& reason) {
    auto current = store_.find(id);
    if (!current) {
        return Result<bool>::Err(ErrorKind::NotFound, fmt::format("instance '{}' not found", id));
    }
    if (current->instance.status != InstanceStatus::Running) {
        return Result<bool>::Ok(false);
    }

    auto r = exec_.execute(fmt::format("lxc stop {}", id));
    if (r.is_err()) return Result<bool>::Fail(r);

    bool applied = false;
    std::string owner;
    auto saved = store_.commit([&](FleetState& s) {
        Instance* inst = s.find(id, &owner);
        // Re-check: a racing operation may have changed the status meanwhile
        if (!inst || inst->status != InstanceStatus::Running) return;
        inst->status = InstanceStatus::Suspended;
        inst->suspension_history.push_back({now_iso(), reason, AUTO_SYSTEM_ACTOR});
        applied = true;
    });
    if (saved.is_err()) return Result<bool>::Fail(saved);
    if (!applied) return Result<bool>::Ok(false);

    warden_log(fmt::format("instance_guardian: suspended {}: {}", id, reason));
    notify_best_effort(notifier_, owner,
        fmt::format("Your instance {} was automatically suspended. Reason: {}. "
                    "Contact an admin to have it unsuspended.", id, reason));
    return Result<bool>::Ok(true);
}

InstanceGuardian::TickReport InstanceGuardian::tick() {
    TickReport report;

    std::vector<std::string> targets;
    store_.mutate([&](FleetState& s) {
        for (const auto& [owner, list] : s.instances) {
            for (const auto& inst : list) {
                if (inst.status == InstanceStatus::Running) targets.push_back(inst.id);
            }
        }
    });

    for (const auto& id : targets) {
        if (stopping_) break;
        report.checked++;

        auto usage = probe_.instance_usage(id);
        if (usage.is_err()) {
            warden_log(fmt::format("instance_guardian: sampling {} failed: {}", id, usage.error));
            report.failures++;
            continue;
        }

        std::string reason = breach_reason(usage.value);
        if (reason.empty()) continue;

        auto r = handle_breach(id, reason);
        if (r.is_err()) {
            warden_log(fmt::format("instance_guardian: suspending {} failed: {}", id, r.describe()));
            report.failures++;
        } else if (r.value) {
            report.suspended.push_back(id);
        }
    }
    return report;
}

// ── Guardian loop ───────────────────────────────────────────

void InstanceGuardian::guardian_loop() {
    while (running_) {
        auto report = tick();
        if (report.checked > 0) {
            warden_log(fmt::format("instance_guardian: checked {}, suspended {}, failures {}",
                                   report.checked, report.suspended.size(), report.failures));
        }

        // Sleep in slices so stop() returns promptly
        for (int waited = 0; running_ && waited < interval_secs_ * 1000;
             waited += GUARDIAN_SLEEP_SLICE_MS) {
            platform::sleep_ms(GUARDIAN_SLEEP_SLICE_MS);
        }
    }
}
