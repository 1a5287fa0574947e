#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include "command_executor.hpp"
#include "instance_store.hpp"

struct PortSummary {
    int slots = 0;
    std::vector<PortForward> forwards;
};

// Hands out host ports from a fixed range against per-user slot quotas.
// Each forward is a pair of proxy devices (tcp + udp) on the instance.
class PortAllocator {
public:
    PortAllocator(InstanceStore& store, CommandExecutor& exec, PortRange range);

    // Lowest host port in range not mapped by any user.
    std::optional<int> next_port() const;

    Result<PortForward> allocate(const std::string& user, const std::string& instance_id,
                                 int internal_port);

    // Device removal failures are logged; the record is always dropped.
    Result<void> release(const std::string& user, int host_port);

    Result<int> add_slots(const std::string& user, int amount);

    PortSummary list(const std::string& user) const;

    // Drop every forward of a deleted instance. The proxy devices go with
    // the container, so no commands are issued. Returns records removed.
    static int drop_instance_forwards(FleetState& state, const std::string& instance_id);

    static std::optional<int> lowest_free(const std::set<int>& used, const PortRange& range);

    const PortRange& range() const { return range_; }

private:
    Result<std::string> add_device(const std::string& instance_id, int host_port,
                                   int internal_port, const char* proto);
    Result<std::string> remove_device(const std::string& instance_id, int host_port,
                                      const char* proto);

    InstanceStore& store_;
    CommandExecutor& exec_;
    PortRange range_;
    std::mutex alloc_mutex_;
};
