#include "lifecycle_manager.hpp"
#include "log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>
#include <sstream>

// ── Clone ───────────────────────────────────────────────────

Result<Instance> LifecycleManager::clone(const std::string& id, const std::string& new_id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<Instance>::Fail(found);
    const OwnedInstance source = found.value;

    std::string target = new_id.empty()
        ? fmt::format(CLONE_ID_TEMPLATE, tool_.instance_prefix, id, now_compact())
        : new_id;
    if (!is_valid_name(target)) {
        return Result<Instance>::Err(ErrorKind::Validation,
                                     fmt::format("invalid instance id '{}'", target));
    }
    if (!reserve_id(target)) {
        return Result<Instance>::Err(ErrorKind::Validation,
                                     fmt::format("instance '{}' already exists", target));
    }
    IdReservation reservation(*this, target);

    auto copied = run(fmt::format("lxc copy {} {}", id, target));
    if (copied.is_err()) return Result<Instance>::Fail(copied);

    auto started = run(fmt::format("lxc start {}", target));
    if (started.is_err()) return Result<Instance>::Fail(started);

    Instance inst;
    inst.id = target;
    inst.set_resources(source.instance.resources);
    inst.status = InstanceStatus::Running;
    inst.created_at = now_iso();
    inst.pool = pool_or_default(source.instance);

    auto saved = store_.commit([&](FleetState& s) {
        s.instances[source.owner].push_back(inst);
    });
    if (saved.is_err()) return Result<Instance>::Fail(saved);

    warden_log(fmt::format("lifecycle: cloned {} to {} for {}", id, target, source.owner));
    return Result<Instance>::Ok(inst);
}

// ── Migrate ─────────────────────────────────────────────────
//
// stop, copy to a temporary name in the target pool, delete the original,
// rename the copy back, start. At every point at least one copy exists.

Result<Instance> LifecycleManager::migrate(const std::string& id, const std::string& target_pool) {
    if (!is_valid_name(target_pool)) {
        return Result<Instance>::Err(ErrorKind::Validation,
                                     fmt::format("invalid storage pool '{}'", target_pool));
    }

    auto found = lookup(id);
    if (found.is_err()) return Result<Instance>::Fail(found);
    const Instance& inst = found.value.instance;

    if (inst.suspended()) {
        return Result<Instance>::Err(ErrorKind::StateConflict,
            fmt::format("{} is suspended and cannot be migrated", id));
    }
    if (pool_or_default(inst) == target_pool) {
        return Result<Instance>::Err(ErrorKind::Validation,
            fmt::format("{} is already in pool {}", id, target_pool));
    }

    if (inst.status == InstanceStatus::Running) {
        auto r = run(fmt::format("lxc stop {}", id));
        if (r.is_err()) return Result<Instance>::Fail(r);
        auto recorded = record_event(id, StatusEvent::Stop);
        if (recorded.is_err()) return Result<Instance>::Fail(recorded);
    }

    auto unix_secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string temp = fmt::format(MIGRATE_TEMP_TEMPLATE, tool_.instance_prefix, id, unix_secs);

    auto copied = run(fmt::format("lxc copy {} {} --storage {}", id, temp, target_pool));
    if (copied.is_err()) return Result<Instance>::Fail(copied);

    auto deleted = run(fmt::format("lxc delete {} --force", id));
    if (deleted.is_err()) {
        warden_log(fmt::format("lifecycle: migrate {} left copy {} behind", id, temp));
        return Result<Instance>::Fail(deleted);
    }

    auto renamed = run(fmt::format("lxc rename {} {}", temp, id));
    if (renamed.is_err()) {
        warden_log(fmt::format("lifecycle: migrate {}: data is in {} pending rename", id, temp));
        return Result<Instance>::Fail(renamed);
    }

    auto moved = update_record(id, [&](Instance& i) { i.pool = target_pool; });
    if (moved.is_err()) return Result<Instance>::Fail(moved);

    auto started = run(fmt::format("lxc start {}", id));
    if (started.is_err()) return Result<Instance>::Fail(started);
    auto recorded = record_event(id, StatusEvent::Start);
    if (recorded.is_err()) return Result<Instance>::Fail(recorded);

    warden_log(fmt::format("lifecycle: migrated {} to pool {}", id, target_pool));

    auto after = lookup(id);
    if (after.is_err()) return Result<Instance>::Fail(after);
    return Result<Instance>::Ok(after.value.instance);
}

// ── Snapshots ───────────────────────────────────────────────

Result<std::string> LifecycleManager::snapshot(const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<std::string>::Fail(found);

    std::string name = fmt::format(SNAPSHOT_TEMPLATE, id, now_compact());
    auto r = run(fmt::format("lxc snapshot {} {}", id, name));
    if (r.is_err()) return r;

    warden_log(fmt::format("lifecycle: snapshot {} of {}", name, id));
    return Result<std::string>::Ok(name);
}

Result<void> LifecycleManager::restore(const std::string& id, const std::string& snapshot_name) {
    if (!is_valid_name(snapshot_name)) {
        return Result<void>::Err(ErrorKind::Validation,
                                 fmt::format("invalid snapshot name '{}'", snapshot_name));
    }
    auto found = lookup(id);
    if (found.is_err()) return Result<void>::Fail(found);

    auto r = run(fmt::format("lxc restore {} {}", id, snapshot_name));
    if (r.is_err()) return Result<void>::Fail(r);

    warden_log(fmt::format("lifecycle: restored {} from {}", id, snapshot_name));
    return Result<void>::Ok();
}

Result<std::vector<std::string>> LifecycleManager::list_snapshots(const std::string& id) {
    auto found = lookup(id);
    if (found.is_err()) return Result<std::vector<std::string>>::Fail(found);

    auto r = run("lxc list --type snapshot --columns n");
    if (r.is_err()) return Result<std::vector<std::string>>::Fail(r);

    // Table rows look like "| name |"; keep the cells that mention the id
    std::vector<std::string> names;
    std::istringstream in(r.value);
    std::string line;
    while (std::getline(in, line)) {
        std::string cell;
        for (char c : line) {
            if (c != '|') cell += c;
        }
        trim(cell);
        if (cell.empty() || cell == "NAME" || cell.find(id) == std::string::npos) continue;
        if (cell.find_first_not_of("+-") == std::string::npos) continue;
        names.push_back(cell);
    }
    return Result<std::vector<std::string>>::Ok(names);
}
