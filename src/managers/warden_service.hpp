#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/config.hpp>
#include "instance_store.hpp"
#include "command_executor.hpp"
#include "usage_probe.hpp"
#include "port_allocator.hpp"
#include "host_guardian.hpp"
#include "instance_guardian.hpp"
#include "confirmation_registry.hpp"
#include "access_control.hpp"
#include "notifier.hpp"
#include "lifecycle_manager.hpp"
#include "inspector.hpp"

// Headless service facade: owns every component and checks the acting
// user's rights before each operation. Any front end only needs this.
class WardenService {
public:
    // Without an executor, open() resolves the configured tool and spawns
    // real processes.
    explicit WardenService(Config config,
                           std::unique_ptr<CommandExecutor> exec = nullptr,
                           std::unique_ptr<OwnerNotifier> notifier = nullptr,
                           std::unique_ptr<RoleGateway> roles = nullptr);
    ~WardenService();

    WardenService(const WardenService&) = delete;
    WardenService& operator=(const WardenService&) = delete;

    // Resolve the tool, load the store and wire the managers.
    Result<void> open();
    bool is_open() const { return lifecycle_ != nullptr; }

    void start_guardians();
    void stop_guardians();

    // ── Instances ─────────────────────────────────────────────

    Result<Instance> create_instance(const std::string& actor, const std::string& owner,
                                     int ram_gb, int cpu, int disk_gb);
    Result<void> delete_instance(const std::string& actor, const std::string& id,
                                 const std::string& reason);

    // Owners see their own; admins may list anyone's.
    Result<std::vector<Instance>> list_instances(const std::string& actor,
                                                 const std::string& owner) const;
    Result<std::string> resolve_number(const std::string& owner, int number) const;

    Result<InstanceStatus> start_instance(const std::string& actor, const std::string& id);
    Result<InstanceStatus> stop_instance(const std::string& actor, const std::string& id);
    Result<InstanceStatus> restart_instance(const std::string& actor, const std::string& id);

    Result<void> suspend_instance(const std::string& actor, const std::string& id,
                                  const std::string& reason);
    Result<void> unsuspend_instance(const std::string& actor, const std::string& id);

    Result<Instance> resize_instance(const std::string& actor, const std::string& id,
                                     const ResizeRequest& request);

    Result<PendingConfirmation> request_reinstall(const std::string& actor, const std::string& id);
    Result<PendingConfirmation> request_stop_all(const std::string& actor);
    Result<std::string> confirm(const std::string& actor, const std::string& handle);
    Result<void> cancel(const std::string& actor, const std::string& handle);

    Result<Instance> clone_instance(const std::string& actor, const std::string& id,
                                    const std::string& new_id);
    Result<Instance> migrate_instance(const std::string& actor, const std::string& id,
                                      const std::string& pool);
    Result<std::string> snapshot_instance(const std::string& actor, const std::string& id);
    Result<void> restore_instance(const std::string& actor, const std::string& id,
                                  const std::string& name);
    Result<std::vector<std::string>> list_snapshots(const std::string& actor, const std::string& id);

    // ── Sharing and admins ────────────────────────────────────

    Result<void> share_instance(const std::string& actor, const std::string& id,
                                const std::string& user);
    Result<void> revoke_share(const std::string& actor, const std::string& id,
                              const std::string& user);
    Result<void> add_admin(const std::string& actor, const std::string& user);
    Result<void> remove_admin(const std::string& actor, const std::string& user);
    AdminRegistry admins() const;

    // ── Ports ─────────────────────────────────────────────────

    Result<int> add_port_slots(const std::string& actor, const std::string& user, int amount);
    Result<PortForward> forward_port(const std::string& actor, const std::string& id,
                                     int internal_port);
    Result<void> release_port(const std::string& actor, int host_port);
    PortSummary list_ports(const std::string& user) const;

    // ── Inspection ────────────────────────────────────────────

    Result<LiveStats> live_stats(const std::string& actor, const std::string& id);
    Result<std::string> processes(const std::string& actor, const std::string& id);
    Result<std::string> logs(const std::string& actor, const std::string& id, int lines);
    Result<std::string> exec_in(const std::string& actor, const std::string& id,
                                const std::string& command);
    Result<FleetStats> fleet_stats(const std::string& actor) const;
    Result<std::vector<AuditEntry>> suspension_log(const std::string& actor,
                                                   const std::optional<std::string>& id) const;

    // ── Guardians ─────────────────────────────────────────────

    Result<void> set_host_guardian(const std::string& actor, bool enabled);
    Result<HostGuardian::TickReport> check_host_now(const std::string& actor);
    Result<InstanceGuardian::TickReport> check_instances_now(const std::string& actor);

    // ── Components ────────────────────────────────────────────

    const Config& config() const { return config_; }
    InstanceStore& store() { return *store_; }
    LifecycleManager& lifecycle() { return *lifecycle_; }
    AccessControl& access() { return *access_; }
    PortAllocator& ports() { return *ports_; }
    HostGuardian& host_guardian() { return *host_guardian_; }
    InstanceGuardian& instance_guardian() { return *instance_guardian_; }
    Inspector& inspector() { return *inspector_; }

private:
    Result<void> authorize(const std::string& actor, const std::string& id, Action action) const;

    Config config_;
    std::unique_ptr<CommandExecutor> exec_;
    std::unique_ptr<OwnerNotifier> notifier_;
    std::unique_ptr<RoleGateway> roles_;

    std::unique_ptr<InstanceStore> store_;
    std::unique_ptr<UsageProbe> probe_;
    std::unique_ptr<ConfirmationRegistry> confirmations_;
    std::unique_ptr<AccessControl> access_;
    std::unique_ptr<PortAllocator> ports_;
    std::unique_ptr<LifecycleManager> lifecycle_;
    std::unique_ptr<Inspector> inspector_;
    std::unique_ptr<HostGuardian> host_guardian_;
    std::unique_ptr<InstanceGuardian> instance_guardian_;
};
