#include "lifecycle_manager.hpp"
#include "log.hpp"
#include <fmt/format.h>

// ── Resize ──────────────────────────────────────────────────
//
// A running instance is stopped first and started again at the end. Each
// changed dimension gets its own command, and the record is updated right
// after that command succeeds, so a failure part-way leaves the record
// matching what the tool actually applied.

Result<Instance> LifecycleManager::resize(const std::string& id, const ResizeRequest& request) {
    auto found = lookup(id);
    if (found.is_err()) return Result<Instance>::Fail(found);
    const Instance& before = found.value.instance;

    auto target = resolve_resize(before.resources, request);
    if (target.is_err()) return Result<Instance>::Fail(target);
    const ResourceSpec& want = target.value;

    bool was_running = before.status == InstanceStatus::Running;
    if (was_running) {
        auto r = run(fmt::format("lxc stop {}", id));
        if (r.is_err()) return Result<Instance>::Fail(r);
        auto recorded = record_event(id, StatusEvent::Stop);
        if (recorded.is_err()) return Result<Instance>::Fail(recorded);
    }

    ResourceSpec applied = before.resources;

    if (want.ram_gb != applied.ram_gb) {
        auto r = run(fmt::format("lxc config set {} limits.memory {}", id,
                                 memory_limit_arg(want.ram_gb)));
        if (r.is_err()) return Result<Instance>::Fail(r);
        applied.ram_gb = want.ram_gb;
        auto saved = update_record(id, [&](Instance& i) { i.set_resources(applied); });
        if (saved.is_err()) return Result<Instance>::Fail(saved);
    }

    if (want.cpu != applied.cpu) {
        auto r = run(fmt::format("lxc config set {} limits.cpu {}", id, want.cpu));
        if (r.is_err()) return Result<Instance>::Fail(r);
        applied.cpu = want.cpu;
        auto saved = update_record(id, [&](Instance& i) { i.set_resources(applied); });
        if (saved.is_err()) return Result<Instance>::Fail(saved);
    }

    if (want.disk_gb != applied.disk_gb) {
        auto r = run(fmt::format("lxc config device set {} root size {}GB", id, want.disk_gb));
        if (r.is_err()) return Result<Instance>::Fail(r);
        applied.disk_gb = want.disk_gb;
        auto saved = update_record(id, [&](Instance& i) { i.set_resources(applied); });
        if (saved.is_err()) return Result<Instance>::Fail(saved);
    }

    if (was_running) {
        auto r = run(fmt::format("lxc start {}", id));
        if (r.is_err()) return Result<Instance>::Fail(r);
        auto recorded = record_event(id, StatusEvent::Start);
        if (recorded.is_err()) return Result<Instance>::Fail(recorded);
    }

    warden_log(fmt::format("lifecycle: resized {} to {}", id, format_config_string(applied)));

    auto after = lookup(id);
    if (after.is_err()) return Result<Instance>::Fail(after);
    return Result<Instance>::Ok(after.value.instance);
}

Result<Instance> LifecycleManager::add_resources(const std::string& id,
                                                 std::optional<int> ram_gb,
                                                 std::optional<int> cpu,
                                                 std::optional<int> disk_gb) {
    ResizeRequest request;
    request.mode = ResizeRequest::Mode::Add;
    request.ram_gb = ram_gb;
    request.cpu = cpu;
    request.disk_gb = disk_gb;
    return resize(id, request);
}
