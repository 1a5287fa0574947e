#pragma once

#include <atomic>
#include <thread>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "instance_store.hpp"
#include "command_executor.hpp"
#include "usage_probe.hpp"
#include "notifier.hpp"

// Samples CPU and RAM inside every running instance and suspends the ones
// over either threshold. Each suspension is audited with actor "auto-system"
// and the owner is notified.
class InstanceGuardian {
public:
    struct TickReport {
        int checked = 0;
        int failures = 0;                      // sampling or enforcement errors
        std::vector<std::string> suspended;    // ids suspended this tick
    };

    InstanceGuardian(InstanceStore& store, CommandExecutor& exec, UsageProbe& probe,
                     OwnerNotifier* notifier, const GuardianConfig& config);
    ~InstanceGuardian();

    bool start();
    void stop();
    bool running() const { return running_; }

    TickReport tick();

    // Stop and suspend one instance. Returns false (no audit entry) if the
    // instance is no longer running when the record is updated.
    Result<bool> handle_breach(const std::string& id, const std::string& reason);

    // Reason text for a sample, or "" when within both thresholds.
    std::string breach_reason(const InstanceUsage& usage) const;

private:
    void guardian_loop();

    InstanceStore& store_;
    CommandExecutor& exec_;
    UsageProbe& probe_;
    OwnerNotifier* notifier_;
    int cpu_threshold_;
    int ram_threshold_;
    int interval_secs_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};  // abandons a tick in progress
    std::thread thread_;
};
