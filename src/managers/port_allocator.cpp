#include "port_allocator.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <algorithm>

PortAllocator::PortAllocator(InstanceStore& store, CommandExecutor& exec, PortRange range)
    : store_(store), exec_(exec), range_(range) {}

std::optional<int> PortAllocator::lowest_free(const std::set<int>& used, const PortRange& range) {
    for (int p = range.first; p <= range.last; p++) {
        if (used.count(p) == 0) return p;
    }
    return std::nullopt;
}

std::optional<int> PortAllocator::next_port() const {
    auto used = store_.mutate([](FleetState& s) { return s.ports.used_ports(); });
    return lowest_free(used, range_);
}

Result<std::string> PortAllocator::add_device(const std::string& instance_id, int host_port,
                                              int internal_port, const char* proto) {
    return exec_.execute(fmt::format(
        "lxc config device add {0} port-{1}-{3} proxy listen={3}:0.0.0.0:{1} connect={3}:127.0.0.1:{2}",
        instance_id, host_port, internal_port, proto));
}

Result<std::string> PortAllocator::remove_device(const std::string& instance_id, int host_port,
                                                 const char* proto) {
    return exec_.execute(fmt::format("lxc config device remove {} port-{}-{}",
                                     instance_id, host_port, proto));
}

Result<PortForward> PortAllocator::allocate(const std::string& user,
                                            const std::string& instance_id,
                                            int internal_port) {
    if (internal_port < 1 || internal_port > 65535) {
        return Result<PortForward>::Err(ErrorKind::Validation,
            fmt::format("internal port must be within 1..65535 (got {})", internal_port));
    }

    // Held until the mapping is recorded so no two calls pick the same port.
    std::lock_guard<std::mutex> lock(alloc_mutex_);

    auto pick = store_.mutate([&](FleetState& s) -> Result<int> {
        if (!s.exists(instance_id)) {
            return Result<int>::Err(ErrorKind::NotFound,
                                    fmt::format("instance '{}' not found", instance_id));
        }
        int slots = s.ports.slots_for(user);
        if (static_cast<int>(s.ports.active_count(user)) >= slots) {
            return Result<int>::Err(ErrorKind::QuotaExceeded,
                fmt::format("all {} port slots of {} are in use", slots, user));
        }
        auto port = lowest_free(s.ports.used_ports(), range_);
        if (!port) {
            return Result<int>::Err(ErrorKind::QuotaExceeded,
                fmt::format("no free host ports left in {}-{}", range_.first, range_.last));
        }
        return Result<int>::Ok(*port);
    });
    if (pick.is_err()) return Result<PortForward>::Fail(pick);
    int host_port = pick.value;

    auto tcp = add_device(instance_id, host_port, internal_port, "tcp");
    if (tcp.is_err()) return Result<PortForward>::Fail(tcp);

    auto udp = add_device(instance_id, host_port, internal_port, "udp");
    if (udp.is_err()) {
        auto undo = remove_device(instance_id, host_port, "tcp");
        if (undo.is_err()) {
            warden_log(fmt::format("ports: could not remove tcp rule {} on {}: {}",
                                   host_port, instance_id, undo.error));
        }
        return Result<PortForward>::Fail(udp);
    }

    PortForward fwd{instance_id, internal_port, host_port};
    auto saved = store_.commit([&](FleetState& s) {
        s.ports.active[user].push_back(fwd);
    });
    if (saved.is_err()) return Result<PortForward>::Fail(saved);

    warden_log(fmt::format("ports: {} -> {}:{} for {}", host_port, instance_id,
                           internal_port, user));
    return Result<PortForward>::Ok(fwd);
}

Result<void> PortAllocator::release(const std::string& user, int host_port) {
    auto found = store_.mutate([&](FleetState& s) -> std::optional<PortForward> {
        auto it = s.ports.active.find(user);
        if (it == s.ports.active.end()) return std::nullopt;
        for (const auto& f : it->second) {
            if (f.host_port == host_port) return f;
        }
        return std::nullopt;
    });
    if (!found) {
        return Result<void>::Err(ErrorKind::NotFound,
            fmt::format("{} has no forward on host port {}", user, host_port));
    }

    for (const char* proto : {"tcp", "udp"}) {
        auto r = remove_device(found->instance_id, host_port, proto);
        if (r.is_err()) {
            warden_log(fmt::format("ports: could not remove {} rule {} on {}: {}",
                                   proto, host_port, found->instance_id, r.error));
        }
    }

    return store_.commit([&](FleetState& s) {
        auto it = s.ports.active.find(user);
        if (it == s.ports.active.end()) return;
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const PortForward& f) { return f.host_port == host_port; }),
                   list.end());
        if (list.empty()) s.ports.active.erase(it);
    });
}

Result<int> PortAllocator::add_slots(const std::string& user, int amount) {
    if (amount <= 0) {
        return Result<int>::Err(ErrorKind::Validation,
                                fmt::format("slot amount must be positive (got {})", amount));
    }
    int total = 0;
    auto saved = store_.commit([&](FleetState& s) {
        total = (s.ports.slots[user] += amount);
    });
    if (saved.is_err()) return Result<int>::Fail(saved);
    return Result<int>::Ok(total);
}

PortSummary PortAllocator::list(const std::string& user) const {
    return store_.mutate([&](FleetState& s) {
        PortSummary summary;
        summary.slots = s.ports.slots_for(user);
        auto it = s.ports.active.find(user);
        if (it != s.ports.active.end()) summary.forwards = it->second;
        return summary;
    });
}

int PortAllocator::drop_instance_forwards(FleetState& state, const std::string& instance_id) {
    int removed = 0;
    for (auto it = state.ports.active.begin(); it != state.ports.active.end();) {
        auto& list = it->second;
        auto keep = std::remove_if(list.begin(), list.end(),
                                   [&](const PortForward& f) { return f.instance_id == instance_id; });
        removed += static_cast<int>(std::distance(keep, list.end()));
        list.erase(keep, list.end());
        if (list.empty()) {
            it = state.ports.active.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}
