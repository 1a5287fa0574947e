#pragma once

#include <atomic>
#include <thread>
#include <optional>
#include <core/types.hpp>
#include "instance_store.hpp"
#include "command_executor.hpp"
#include "usage_probe.hpp"

// Watches aggregate host CPU. Over the threshold, every instance is
// force-stopped with one `lxc stop --all --force`.
class HostGuardian {
public:
    struct TickReport {
        std::optional<double> cpu;     // unset when sampling failed
        bool breached = false;
        bool enforced = false;         // stop-all command succeeded
        int stopped = 0;               // records moved running -> stopped
    };

    HostGuardian(InstanceStore& store, CommandExecutor& exec, UsageProbe& probe,
                 int cpu_threshold, int interval_secs);
    ~HostGuardian();

    bool start();
    void stop();
    bool running() const { return running_; }

    // Runtime toggle, checked at the top of every iteration.
    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    // One sample-and-enforce pass. Never throws; failures are logged.
    TickReport tick();

    int threshold() const { return cpu_threshold_; }

private:
    void guardian_loop();

    InstanceStore& store_;
    CommandExecutor& exec_;
    UsageProbe& probe_;
    int cpu_threshold_;
    int interval_secs_;

    std::atomic<bool> running_{false};
    std::atomic<bool> enabled_{true};
    std::thread thread_;
};
