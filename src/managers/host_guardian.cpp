#include "host_guardian.hpp"
#include "log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// ── Construction / Destruction ──────────────────────────────

HostGuardian::HostGuardian(InstanceStore& store, CommandExecutor& exec, UsageProbe& probe,
                           int cpu_threshold, int interval_secs)
    : store_(store), exec_(exec), probe_(probe),
      cpu_threshold_(cpu_threshold), interval_secs_(interval_secs) {}

HostGuardian::~HostGuardian() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool HostGuardian::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&HostGuardian::guardian_loop, this);
    warden_log(fmt::format("host_guardian: started (threshold {}%, every {}s)",
                           cpu_threshold_, interval_secs_));
    return true;
}

void HostGuardian::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    warden_log("host_guardian: stopped");
}

// ── Enforcement ─────────────────────────────────────────────

HostGuardian::TickReport HostGuardian::tick() {
    TickReport report;

    auto cpu = probe_.host_cpu();
    if (cpu.is_err()) {
        warden_log("host_guardian: sampling failed: " + cpu.error);
        return report;
    }
    report.cpu = cpu.value;
    warden_log(fmt::format("host_guardian: host cpu {:.1f}%", cpu.value));

    if (cpu.value <= cpu_threshold_) return report;
    report.breached = true;

    warden_log(fmt::format("host_guardian: cpu {:.1f}% over {}%, stopping all instances",
                           cpu.value, cpu_threshold_));
    auto r = exec_.execute("lxc stop --all --force");
    if (r.is_err()) {
        warden_log("host_guardian: stop-all failed: " + r.error);
        return report;
    }
    report.enforced = true;

    auto saved = store_.commit([&](FleetState& s) {
        report.stopped = s.stop_all_running();
    });
    if (saved.is_err()) {
        warden_log("host_guardian: " + saved.describe());
    }
    warden_log(fmt::format("host_guardian: {} instances marked stopped", report.stopped));
    return report;
}

// ── Guardian loop ───────────────────────────────────────────

void HostGuardian::guardian_loop() {
    while (running_) {
        if (enabled_) {
            tick();
        }

        // Sleep in slices so stop() returns promptly
        for (int waited = 0; running_ && waited < interval_secs_ * 1000;
             waited += GUARDIAN_SLEEP_SLICE_MS) {
            platform::sleep_ms(GUARDIAN_SLEEP_SLICE_MS);
        }
    }
}
