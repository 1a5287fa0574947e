#pragma once

#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <core/resource_spec.hpp>
#include <core/instance_status.hpp>
#include "instance_store.hpp"
#include "command_executor.hpp"
#include "confirmation_registry.hpp"
#include "notifier.hpp"

// State-transition operations on instances. Each one is a fixed sequence of
// tool commands with a store commit after every state change that has to
// survive a crash. A failing step aborts the rest; completed steps are kept.
// Callers are expected to have authorized the request already.
class LifecycleManager {
public:
    LifecycleManager(InstanceStore& store, CommandExecutor& exec, const ToolConfig& tool,
                     ConfirmationRegistry& confirmations, OwnerNotifier* notifier,
                     RoleGateway* roles);

    Result<Instance> create(const std::string& owner, int ram_gb, int cpu, int disk_gb);
    Result<void> remove(const std::string& id, const std::string& reason);

    // Start on running and stop on stopped succeed without a command.
    Result<InstanceStatus> start(const std::string& id);
    Result<InstanceStatus> stop(const std::string& id);
    Result<InstanceStatus> restart(const std::string& id);

    Result<void> suspend(const std::string& id, const std::string& reason,
                         const std::string& actor);
    Result<void> unsuspend(const std::string& id, const std::string& actor);

    Result<Instance> resize(const std::string& id, const ResizeRequest& request);
    Result<Instance> add_resources(const std::string& id, std::optional<int> ram_gb,
                                   std::optional<int> cpu, std::optional<int> disk_gb);

    // ── Confirmed operations ─────────────────────────────────
    Result<PendingConfirmation> request_reinstall(const std::string& user, const std::string& id);
    Result<PendingConfirmation> request_stop_all(const std::string& user);

    // Run the pending action. Returns a one-line summary of what happened.
    Result<std::string> confirm(const std::string& handle, const std::string& user);
    Result<void> cancel(const std::string& handle, const std::string& user);

    Result<Instance> reinstall(const std::string& id);
    Result<int> stop_all();

    // ── Copies and snapshots ─────────────────────────────────
    Result<Instance> clone(const std::string& id, const std::string& new_id = "");
    Result<Instance> migrate(const std::string& id, const std::string& target_pool);

    Result<std::string> snapshot(const std::string& id);
    Result<void> restore(const std::string& id, const std::string& snapshot_name);
    Result<std::vector<std::string>> list_snapshots(const std::string& id);

    // "<prefix>-vps-<owner>-<seq>", seq one past the owner's highest.
    static std::string next_instance_id(const FleetState& state, const std::string& prefix,
                                        const std::string& owner,
                                        const std::set<std::string>& reserved = {});

private:
    // Releases a reserved id when a create or clone leaves scope.
    class IdReservation {
    public:
        IdReservation(LifecycleManager& mgr, std::string id);
        ~IdReservation();
        IdReservation(const IdReservation&) = delete;
        IdReservation& operator=(const IdReservation&) = delete;

    private:
        LifecycleManager& mgr_;
        std::string id_;
    };

    // Pick and reserve the next id for owner.
    std::string reserve_instance_id(const std::string& owner);
    // Reserve a caller-chosen id. False if it is taken.
    bool reserve_id(const std::string& id);

    Result<OwnedInstance> lookup(const std::string& id) const;

    // Apply a status event to the live record and save. Fails with
    // StateConflict if the live status no longer permits the event.
    Result<InstanceStatus> record_event(const std::string& id, StatusEvent event,
                                        const SuspensionEntry* audit = nullptr);

    Result<void> update_record(const std::string& id, const std::function<void(Instance&)>& fn);

    // init, limits, disk size and start for a fresh container. *initialized
    // is set once the init step has succeeded.
    Result<void> provision(const std::string& id, const ResourceSpec& spec,
                           const std::string& pool, bool* initialized = nullptr);

    Result<std::string> run(const std::string& command_line);
    std::string pool_or_default(const Instance& inst) const;

    InstanceStore& store_;
    CommandExecutor& exec_;
    ToolConfig tool_;
    ConfirmationRegistry& confirmations_;
    OwnerNotifier* notifier_;
    RoleGateway* roles_;

    std::mutex reserve_mutex_;
    std::set<std::string> reserved_ids_;
};
