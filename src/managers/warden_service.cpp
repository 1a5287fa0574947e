#include "warden_service.hpp"
#include "log.hpp"
#include <fmt/format.h>

// ── Construction / Destruction ──────────────────────────────

WardenService::WardenService(Config config, std::unique_ptr<CommandExecutor> exec,
                             std::unique_ptr<OwnerNotifier> notifier,
                             std::unique_ptr<RoleGateway> roles)
    : config_(std::move(config)), exec_(std::move(exec)),
      notifier_(std::move(notifier)), roles_(std::move(roles)) {}

WardenService::~WardenService() {
    stop_guardians();
}

Result<void> WardenService::open() {
    if (is_open()) return Result<void>::Ok();

    set_warden_log_path(config_.log_file().string());

    if (!exec_) {
        auto tool = ProcessCommandExecutor::resolve_tool(config_.tool().tool);
        if (tool.is_err()) return Result<void>::Fail(tool);
        exec_ = std::make_unique<ProcessCommandExecutor>(tool.value, config_.tool().command_timeout);
        warden_log("service: using tool " + tool.value.string());
    }
    if (!notifier_) {
        notifier_ = std::make_unique<InboxNotifier>(config_.state_dir() / "inbox");
    }
    if (!roles_) {
        roles_ = std::make_unique<LoggingRoleGateway>();
    }

    store_ = std::make_unique<InstanceStore>(config_.state_dir());
    auto loaded = store_->load();
    if (loaded.is_err()) return loaded;

    access_ = std::make_unique<AccessControl>(*store_, notifier_.get());
    auto admin = access_->set_main_admin(config_.main_admin());
    if (admin.is_err()) return admin;

    probe_ = std::make_unique<UsageProbe>(*exec_);
    confirmations_ = std::make_unique<ConfirmationRegistry>(config_.confirm_ttl());
    ports_ = std::make_unique<PortAllocator>(*store_, *exec_, config_.ports());
    inspector_ = std::make_unique<Inspector>(*store_, *exec_, *probe_);
    host_guardian_ = std::make_unique<HostGuardian>(
        *store_, *exec_, *probe_, config_.guardian().cpu_threshold,
        config_.guardian().host_check_interval);
    host_guardian_->set_enabled(config_.guardian().host_guardian_enabled);
    instance_guardian_ = std::make_unique<InstanceGuardian>(
        *store_, *exec_, *probe_, notifier_.get(), config_.guardian());
    lifecycle_ = std::make_unique<LifecycleManager>(
        *store_, *exec_, config_.tool(), *confirmations_, notifier_.get(), roles_.get());

    warden_log(fmt::format("service: open, state in {}", config_.state_dir().string()));
    return Result<void>::Ok();
}

void WardenService::start_guardians() {
    if (!is_open()) return;
    host_guardian_->start();
    instance_guardian_->start();
}

void WardenService::stop_guardians() {
    if (host_guardian_) host_guardian_->stop();
    if (instance_guardian_) instance_guardian_->stop();
}

Result<void> WardenService::authorize(const std::string& actor, const std::string& id,
                                      Action action) const {
    auto r = access_->authorize(actor, id, action);
    if (r.is_err()) return Result<void>::Fail(r);
    return Result<void>::Ok();
}

// ── Instances ───────────────────────────────────────────────

Result<Instance> WardenService::create_instance(const std::string& actor, const std::string& owner,
                                                int ram_gb, int cpu, int disk_gb) {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<Instance>::Fail(admin);
    return lifecycle_->create(owner, ram_gb, cpu, disk_gb);
}

Result<void> WardenService::delete_instance(const std::string& actor, const std::string& id,
                                            const std::string& reason) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return auth;
    return lifecycle_->remove(id, reason);
}

Result<std::vector<Instance>> WardenService::list_instances(const std::string& actor,
                                                            const std::string& owner) const {
    if (actor != owner && !access_->is_admin(actor)) {
        return Result<std::vector<Instance>>::Err(ErrorKind::Validation,
            "only admins can list another user's instances");
    }
    return Result<std::vector<Instance>>::Ok(store_->instances_of(owner));
}

Result<std::string> WardenService::resolve_number(const std::string& owner, int number) const {
    return store_->resolve_number(owner, number);
}

Result<InstanceStatus> WardenService::start_instance(const std::string& actor,
                                                     const std::string& id) {
    auto auth = authorize(actor, id, Action::Operate);
    if (auth.is_err()) return Result<InstanceStatus>::Fail(auth);
    return lifecycle_->start(id);
}

Result<InstanceStatus> WardenService::stop_instance(const std::string& actor,
                                                    const std::string& id) {
    auto auth = authorize(actor, id, Action::Operate);
    if (auth.is_err()) return Result<InstanceStatus>::Fail(auth);
    return lifecycle_->stop(id);
}

Result<InstanceStatus> WardenService::restart_instance(const std::string& actor,
                                                       const std::string& id) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<InstanceStatus>::Fail(auth);
    return lifecycle_->restart(id);
}

Result<void> WardenService::suspend_instance(const std::string& actor, const std::string& id,
                                             const std::string& reason) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return auth;
    return lifecycle_->suspend(id, reason, actor);
}

Result<void> WardenService::unsuspend_instance(const std::string& actor, const std::string& id) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return auth;
    return lifecycle_->unsuspend(id, actor);
}

Result<Instance> WardenService::resize_instance(const std::string& actor, const std::string& id,
                                                const ResizeRequest& request) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<Instance>::Fail(auth);
    return lifecycle_->resize(id, request);
}

Result<PendingConfirmation> WardenService::request_reinstall(const std::string& actor,
                                                             const std::string& id) {
    auto auth = authorize(actor, id, Action::Destroy);
    if (auth.is_err()) return Result<PendingConfirmation>::Fail(auth);
    return lifecycle_->request_reinstall(actor, id);
}

Result<PendingConfirmation> WardenService::request_stop_all(const std::string& actor) {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<PendingConfirmation>::Fail(admin);
    return lifecycle_->request_stop_all(actor);
}

Result<std::string> WardenService::confirm(const std::string& actor, const std::string& handle) {
    return lifecycle_->confirm(handle, actor);
}

Result<void> WardenService::cancel(const std::string& actor, const std::string& handle) {
    return lifecycle_->cancel(handle, actor);
}

Result<Instance> WardenService::clone_instance(const std::string& actor, const std::string& id,
                                               const std::string& new_id) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<Instance>::Fail(auth);
    return lifecycle_->clone(id, new_id);
}

Result<Instance> WardenService::migrate_instance(const std::string& actor, const std::string& id,
                                                 const std::string& pool) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<Instance>::Fail(auth);
    return lifecycle_->migrate(id, pool);
}

Result<std::string> WardenService::snapshot_instance(const std::string& actor,
                                                     const std::string& id) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<std::string>::Fail(auth);
    return lifecycle_->snapshot(id);
}

Result<void> WardenService::restore_instance(const std::string& actor, const std::string& id,
                                             const std::string& name) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return auth;
    return lifecycle_->restore(id, name);
}

Result<std::vector<std::string>> WardenService::list_snapshots(const std::string& actor,
                                                               const std::string& id) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<std::vector<std::string>>::Fail(auth);
    return lifecycle_->list_snapshots(id);
}

// ── Sharing and admins ──────────────────────────────────────

Result<void> WardenService::share_instance(const std::string& actor, const std::string& id,
                                           const std::string& user) {
    return access_->share(actor, id, user);
}

Result<void> WardenService::revoke_share(const std::string& actor, const std::string& id,
                                         const std::string& user) {
    return access_->revoke(actor, id, user);
}

Result<void> WardenService::add_admin(const std::string& actor, const std::string& user) {
    return access_->add_admin(actor, user);
}

Result<void> WardenService::remove_admin(const std::string& actor, const std::string& user) {
    return access_->remove_admin(actor, user);
}

AdminRegistry WardenService::admins() const {
    return store_->snapshot().admins;
}

// ── Ports ───────────────────────────────────────────────────

Result<int> WardenService::add_port_slots(const std::string& actor, const std::string& user,
                                          int amount) {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<int>::Fail(admin);
    return ports_->add_slots(user, amount);
}

Result<PortForward> WardenService::forward_port(const std::string& actor, const std::string& id,
                                                int internal_port) {
    auto auth = authorize(actor, id, Action::Operate);
    if (auth.is_err()) return Result<PortForward>::Fail(auth);
    return ports_->allocate(actor, id, internal_port);
}

Result<void> WardenService::release_port(const std::string& actor, int host_port) {
    return ports_->release(actor, host_port);
}

PortSummary WardenService::list_ports(const std::string& user) const {
    return ports_->list(user);
}

// ── Inspection ──────────────────────────────────────────────

Result<LiveStats> WardenService::live_stats(const std::string& actor, const std::string& id) {
    auto auth = authorize(actor, id, Action::Operate);
    if (auth.is_err()) return Result<LiveStats>::Fail(auth);
    return inspector_->live_stats(id);
}

Result<std::string> WardenService::processes(const std::string& actor, const std::string& id) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<std::string>::Fail(auth);
    return inspector_->processes(id);
}

Result<std::string> WardenService::logs(const std::string& actor, const std::string& id,
                                        int lines) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<std::string>::Fail(auth);
    return inspector_->logs(id, lines);
}

Result<std::string> WardenService::exec_in(const std::string& actor, const std::string& id,
                                           const std::string& command) {
    auto auth = authorize(actor, id, Action::Administer);
    if (auth.is_err()) return Result<std::string>::Fail(auth);
    return inspector_->exec(id, command);
}

Result<FleetStats> WardenService::fleet_stats(const std::string& actor) const {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<FleetStats>::Fail(admin);
    return Result<FleetStats>::Ok(inspector_->fleet_stats());
}

Result<std::vector<AuditEntry>> WardenService::suspension_log(
        const std::string& actor, const std::optional<std::string>& id) const {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<std::vector<AuditEntry>>::Fail(admin);
    return inspector_->suspension_log(id);
}

// ── Guardians ───────────────────────────────────────────────

Result<void> WardenService::set_host_guardian(const std::string& actor, bool enabled) {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return admin;
    host_guardian_->set_enabled(enabled);
    warden_log(fmt::format("service: {} turned the host guardian {}", actor,
                           enabled ? "on" : "off"));
    return Result<void>::Ok();
}

Result<HostGuardian::TickReport> WardenService::check_host_now(const std::string& actor) {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<HostGuardian::TickReport>::Fail(admin);
    return Result<HostGuardian::TickReport>::Ok(host_guardian_->tick());
}

Result<InstanceGuardian::TickReport> WardenService::check_instances_now(const std::string& actor) {
    auto admin = access_->require_admin(actor);
    if (admin.is_err()) return Result<InstanceGuardian::TickReport>::Fail(admin);
    return Result<InstanceGuardian::TickReport>::Ok(instance_guardian_->tick());
}
