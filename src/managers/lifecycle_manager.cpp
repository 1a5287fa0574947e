#include "lifecycle_manager.hpp"
#include "port_allocator.hpp"
#include "log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// ── Construction ────────────────────────────────────────────

LifecycleManager::LifecycleManager(InstanceStore& store, CommandExecutor& exec,
                                   const ToolConfig& tool, ConfirmationRegistry& confirmations,
                                   OwnerNotifier* notifier, RoleGateway* roles)
    : store_(store), exec_(exec), tool_(tool), confirmations_(confirmations),
      notifier_(notifier), roles_(roles) {}

LifecycleManager::IdReservation::IdReservation(LifecycleManager& mgr, std::string id)
    : mgr_(mgr), id_(std::move(id)) {}

LifecycleManager::IdReservation::~IdReservation() {
    std::lock_guard<std::mutex> lock(mgr_.reserve_mutex_);
    mgr_.reserved_ids_.erase(id_);
}

// ── Helpers ─────────────────────────────────────────────────

std::string LifecycleManager::next_instance_id(const FleetState& state,
                                               const std::string& prefix,
                                               const std::string& owner,
                                               const std::set<std::string>& reserved) {
    std::string stem = fmt::format(INSTANCE_ID_TEMPLATE, prefix, owner, "");

    int highest = 0;
    auto it = state.instances.find(owner);
    if (it != state.instances.end()) {
        for (const auto& inst : it->second) {
            if (inst.id.rfind(stem, 0) != 0) continue;
            auto seq = parse_int(inst.id.substr(stem.size()));
            if (seq && *seq > highest) highest = *seq;
        }
    }

    int seq = highest + 1;
    std::string id = fmt::format(INSTANCE_ID_TEMPLATE, prefix, owner, seq);
    while (state.exists(id) || reserved.count(id)) {
        id = fmt::format(INSTANCE_ID_TEMPLATE, prefix, owner, ++seq);
    }
    return id;
}

std::string LifecycleManager::reserve_instance_id(const std::string& owner) {
    std::lock_guard<std::mutex> lock(reserve_mutex_);
    std::string id = store_.mutate([&](FleetState& s) {
        return next_instance_id(s, tool_.instance_prefix, owner, reserved_ids_);
    });
    reserved_ids_.insert(id);
    return id;
}

bool LifecycleManager::reserve_id(const std::string& id) {
    std::lock_guard<std::mutex> lock(reserve_mutex_);
    if (reserved_ids_.count(id) || store_.exists(id)) return false;
    reserved_ids_.insert(id);
    return true;
}

Result<OwnedInstance> LifecycleManager::lookup(const std::string& id) const {
    auto found = store_.find(id);
    if (!found) {
        return Result<OwnedInstance>::Err(ErrorKind::NotFound,
                                          fmt::format("instance '{}' not found", id));
    }
    return Result<OwnedInstance>::Ok(*found);
}

Result<std::string> LifecycleManager::run(const std::string& command_line) {
    return exec_.execute(command_line, tool_.command_timeout);
}

std::string LifecycleManager::pool_or_default(const Instance& inst) const {
    return inst.pool.empty() ? tool_.storage_pool : inst.pool;
}

Result<InstanceStatus> LifecycleManager::record_event(const std::string& id, StatusEvent event,
                                                      const SuspensionEntry* audit) {
    auto r = store_.mutate([&](FleetState& s) -> Result<InstanceStatus> {
        Instance* inst = s.find(id);
        if (!inst) {
            return Result<InstanceStatus>::Err(ErrorKind::NotFound,
                                               fmt::format("instance '{}' not found", id));
        }
        auto next = apply_transition(inst->status, event);
        if (next.is_err()) return next;
        inst->status = next.value;
        if (audit) inst->suspension_history.push_back(*audit);
        return next;
    });
    if (r.is_err()) return r;

    auto saved = store_.save();
    if (saved.is_err()) return Result<InstanceStatus>::Fail(saved);
    return r;
}

Result<void> LifecycleManager::update_record(const std::string& id,
                                             const std::function<void(Instance&)>& fn) {
    bool found = store_.mutate([&](FleetState& s) {
        Instance* inst = s.find(id);
        if (!inst) return false;
        fn(*inst);
        return true;
    });
    if (!found) {
        return Result<void>::Err(ErrorKind::NotFound,
                                 fmt::format("instance '{}' disappeared from the store", id));
    }
    return store_.save();
}

Result<void> LifecycleManager::provision(const std::string& id, const ResourceSpec& spec,
                                         const std::string& pool, bool* initialized) {
    const std::string steps[] = {
        fmt::format("lxc init {} {} --storage {}", shell_quote(tool_.image), id, shell_quote(pool)),
        fmt::format("lxc config set {} limits.memory {}", id, memory_limit_arg(spec.ram_gb)),
        fmt::format("lxc config set {} limits.cpu {}", id, spec.cpu),
        fmt::format("lxc config device set {} root size {}GB", id, spec.disk_gb),
        fmt::format("lxc start {}", id),
    };
    if (initialized) *initialized = false;
    for (const auto& cmd : steps) {
        auto r = run(cmd);
        if (r.is_err()) return Result<void>::Fail(r);
        if (initialized) *initialized = true;
    }
    return Result<void>::Ok();
}

// ── Create / delete ─────────────────────────────────────────

Result<Instance> LifecycleManager::create(const std::string& owner, int ram_gb, int cpu,
                                          int disk_gb) {
    if (!is_valid_name(owner)) {
        return Result<Instance>::Err(ErrorKind::Validation,
                                     fmt::format("invalid owner id '{}'", owner));
    }
    auto valid = validate_resources(ram_gb, cpu, disk_gb);
    if (valid.is_err()) return Result<Instance>::Fail(valid);

    std::string id = reserve_instance_id(owner);
    IdReservation reservation(*this, id);

    ResourceSpec spec{ram_gb, cpu, disk_gb};
    warden_log(fmt::format("lifecycle: creating {} for {} ({})", id, owner,
                           format_config_string(spec)));

    bool initialized = false;
    auto provisioned = provision(id, spec, tool_.storage_pool, &initialized);
    if (provisioned.is_err()) {
        warden_log(fmt::format("lifecycle: create {} failed: {}", id, provisioned.error));
        // Nothing records the half-built container; remove it so the id stays free
        if (initialized) {
            auto cleaned = run(fmt::format("lxc delete {} --force", id));
            if (cleaned.is_err()) {
                warden_log(fmt::format("lifecycle: cleanup of {} failed: {}", id, cleaned.error));
            }
        }
        return Result<Instance>::Fail(provisioned);
    }

    Instance inst;
    inst.id = id;
    inst.set_resources(spec);
    inst.status = InstanceStatus::Running;
    inst.created_at = now_iso();
    inst.pool = tool_.storage_pool;

    auto saved = store_.commit([&](FleetState& s) {
        s.instances[owner].push_back(inst);
    });
    if (saved.is_err()) return Result<Instance>::Fail(saved);

    if (roles_) {
        auto granted = roles_->grant_owner_role(owner);
        if (granted.is_err()) {
            warden_log(fmt::format("lifecycle: owner role for {} not granted: {}", owner, granted.error));
        }
    }
    notify_best_effort(notifier_, owner,
        fmt::format("Your instance {} is ready: {}", id, inst.config));
    return Result<Instance>::Ok(inst);
}

Result<void> LifecycleManager::remove(const std::string& id, const std::string& reason) {
    auto found = lookup(id);
    if (found.is_err()) return Result<void>::Fail(found);
    const std::string owner = found.value.owner;

    // Already stopped or absent is fine here
    auto stopped = run(fmt::format("lxc stop {} --force", id));
    if (stopped.is_err()) {
        warden_log(fmt::format("lifecycle: force-stop before delete of {} ignored: {}", id, stopped.error));
    }

    auto deleted = run(fmt::format("lxc delete {} --force", id));
    if (deleted.is_err()) return Result<void>::Fail(deleted);

    bool owner_has_more = true;
    int dropped = 0;
    auto saved = store_.commit([&](FleetState& s) {
        s.erase(id);
        dropped = PortAllocator::drop_instance_forwards(s, id);
        owner_has_more = s.instances.count(owner) > 0;
    });
    if (saved.is_err()) return saved;

    warden_log(fmt::format("lifecycle: deleted {} of {} ({} forwards dropped): {}",
                           id, owner, dropped, reason));

    if (!owner_has_more && roles_) {
        auto revoked = roles_->revoke_owner_role(owner);
        if (revoked.is_err()) {
            warden_log(fmt::format("lifecycle: owner role of {} not revoked: {}", owner, revoked.error));
        }
    }
    notify_best_effort(notifier_, owner,
        fmt::format("Your instance {} was deleted. Reason: {}", id,
                    reason.empty() ? "not given" : reason));
    return Result<void>::Ok();
}

// ── Status transitions ──────────────────────────────────────

Result<InstanceStatus> LifecycleManager::start(const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<InstanceStatus>::Fail(found);

    InstanceStatus current = found.value.instance.status;
    auto next = apply_transition(current, StatusEvent::Start);
    if (next.is_err() || is_noop_transition(current, StatusEvent::Start)) return next;

    auto r = run(fmt::format("lxc start {}", id));
    if (r.is_err()) return Result<InstanceStatus>::Fail(r);
    return record_event(id, StatusEvent::Start);
}

Result<InstanceStatus> LifecycleManager::stop(const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<InstanceStatus>::Fail(found);

    InstanceStatus current = found.value.instance.status;
    auto next = apply_transition(current, StatusEvent::Stop);
    if (next.is_err() || is_noop_transition(current, StatusEvent::Stop)) return next;

    auto r = run(fmt::format("lxc stop {}", id));
    if (r.is_err()) return Result<InstanceStatus>::Fail(r);
    return record_event(id, StatusEvent::Stop);
}

Result<InstanceStatus> LifecycleManager::restart(const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<InstanceStatus>::Fail(found);

    switch (found.value.instance.status) {
        case InstanceStatus::Running: {
            auto r = run(fmt::format("lxc restart {}", id));
            if (r.is_err()) return Result<InstanceStatus>::Fail(r);
            return Result<InstanceStatus>::Ok(InstanceStatus::Running);
        }
        case InstanceStatus::Stopped:
            return start(id);
        case InstanceStatus::Suspended:
            break;
    }
    return Result<InstanceStatus>::Err(ErrorKind::StateConflict,
        fmt::format("cannot restart {} while it is suspended (unsuspend it first)", id));
}

Result<void> LifecycleManager::suspend(const std::string& id, const std::string& reason,
                                       const std::string& actor) {
    auto found = lookup(id);
    if (found.is_err()) return Result<void>::Fail(found);

    auto next = apply_transition(found.value.instance.status, StatusEvent::Suspend);
    if (next.is_err()) return Result<void>::Fail(next);

    auto r = run(fmt::format("lxc stop {}", id));
    if (r.is_err()) return Result<void>::Fail(r);

    SuspensionEntry entry{now_iso(), reason.empty() ? "suspended by admin" : reason, actor};
    auto recorded = record_event(id, StatusEvent::Suspend, &entry);
    if (recorded.is_err()) return Result<void>::Fail(recorded);

    warden_log(fmt::format("lifecycle: {} suspended {}: {}", actor, id, entry.reason));
    notify_best_effort(notifier_, found.value.owner,
        fmt::format("Your instance {} was suspended by {}. Reason: {}", id, actor, entry.reason));
    return Result<void>::Ok();
}

Result<void> LifecycleManager::unsuspend(const std::string& id, const std::string& actor) {
    auto found = lookup(id);
    if (found.is_err()) return Result<void>::Fail(found);

    auto next = apply_transition(found.value.instance.status, StatusEvent::Unsuspend);
    if (next.is_err()) return Result<void>::Fail(next);

    auto r = run(fmt::format("lxc start {}", id));
    if (r.is_err()) return Result<void>::Fail(r);

    auto recorded = record_event(id, StatusEvent::Unsuspend);
    if (recorded.is_err()) return Result<void>::Fail(recorded);

    warden_log(fmt::format("lifecycle: {} unsuspended {}", actor, id));
    notify_best_effort(notifier_, found.value.owner,
        fmt::format("Your instance {} was unsuspended by {} and is running again", id, actor));
    return Result<void>::Ok();
}
