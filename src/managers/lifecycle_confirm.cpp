#include "lifecycle_manager.hpp"
#include "log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

// ── Two-phase destructive operations ────────────────────────

Result<PendingConfirmation> LifecycleManager::request_reinstall(const std::string& user,
                                                                const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<PendingConfirmation>::Fail(found);
    if (found.value.instance.suspended()) {
        return Result<PendingConfirmation>::Err(ErrorKind::StateConflict,
            fmt::format("{} is suspended and cannot be reinstalled", id));
    }
    confirmations_.purge_expired();
    return Result<PendingConfirmation>::Ok(
        confirmations_.request(PendingAction::Reinstall, user, id));
}

Result<PendingConfirmation> LifecycleManager::request_stop_all(const std::string& user) {
    confirmations_.purge_expired();
    return Result<PendingConfirmation>::Ok(
        confirmations_.request(PendingAction::StopAll, user, ""));
}

Result<std::string> LifecycleManager::confirm(const std::string& handle, const std::string& user) {
    auto pending = confirmations_.confirm(handle, user);
    if (pending.is_err()) return Result<std::string>::Fail(pending);

    switch (pending.value.action) {
        case PendingAction::Reinstall: {
            auto r = reinstall(pending.value.target);
            if (r.is_err()) return Result<std::string>::Fail(r);
            return Result<std::string>::Ok(
                fmt::format("{} reinstalled ({})", r.value.id, r.value.config));
        }
        case PendingAction::StopAll: {
            auto r = stop_all();
            if (r.is_err()) return Result<std::string>::Fail(r);
            return Result<std::string>::Ok(fmt::format("stopped {} running instances", r.value));
        }
    }
    return Result<std::string>::Err(ErrorKind::Validation, "unknown pending action");
}

Result<void> LifecycleManager::cancel(const std::string& handle, const std::string& user) {
    auto pending = confirmations_.cancel(handle, user);
    if (pending.is_err()) return Result<void>::Fail(pending);
    return Result<void>::Ok();
}

// ── Reinstall ───────────────────────────────────────────────
//
// After the delete step the container is gone while the record remains
// (marked stopped) until provisioning completes. A failure in between is
// visible in the record and fixed by reinstalling again.

Result<Instance> LifecycleManager::reinstall(const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<Instance>::Fail(found);
    const Instance original = found.value.instance;
    if (original.suspended()) {
        return Result<Instance>::Err(ErrorKind::StateConflict,
            fmt::format("{} is suspended and cannot be reinstalled", id));
    }

    warden_log(fmt::format("lifecycle: reinstalling {} ({})", id, original.config));

    auto stopped = run(fmt::format("lxc stop {} --force", id));
    if (stopped.is_err()) {
        warden_log(fmt::format("lifecycle: force-stop before reinstall of {} ignored: {}",
                               id, stopped.error));
    }

    auto deleted = run(fmt::format("lxc delete {} --force", id));
    if (deleted.is_err()) return Result<Instance>::Fail(deleted);

    auto marked = update_record(id, [](Instance& i) { i.status = InstanceStatus::Stopped; });
    if (marked.is_err()) return Result<Instance>::Fail(marked);

    auto provisioned = provision(id, original.resources, pool_or_default(original));
    if (provisioned.is_err()) {
        warden_log(fmt::format("lifecycle: {} deleted but not recreated: {}", id, provisioned.error));
        return Result<Instance>::Fail(provisioned);
    }

    std::string created = now_iso();
    auto saved = update_record(id, [&](Instance& i) {
        i.status = InstanceStatus::Running;
        i.created_at = created;
        i.set_resources(original.resources);
    });
    if (saved.is_err()) return Result<Instance>::Fail(saved);

    notify_best_effort(notifier_, found.value.owner,
        fmt::format("Your instance {} was reinstalled with a fresh system", id));

    auto after = lookup(id);
    if (after.is_err()) return Result<Instance>::Fail(after);
    return Result<Instance>::Ok(after.value.instance);
}

// ── Stop all ────────────────────────────────────────────────

Result<int> LifecycleManager::stop_all() {
    auto r = run("lxc stop --all --force");
    if (r.is_err()) return Result<int>::Fail(r);

    int stopped = 0;
    auto saved = store_.commit([&](FleetState& s) {
        stopped = s.stop_all_running();
    });
    if (saved.is_err()) return Result<int>::Fail(saved);

    warden_log(fmt::format("lifecycle: stop-all marked {} instances stopped", stopped));
    return Result<int>::Ok(stopped);
}
