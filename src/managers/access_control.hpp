#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "instance_store.hpp"
#include "notifier.hpp"

// What a caller wants to do with an instance.
enum class Action {
    Operate,     // start, stop, stats, port forwarding
    Destroy,     // reinstall
    Administer,  // delete, suspend, unsuspend, resize, clone, migrate, restart, snapshot, exec
};

const char* action_name(Action action);

// Admin registry and sharing grants, plus the permission check used by
// every front-end entry point.
class AccessControl {
public:
    AccessControl(InstanceStore& store, OwnerNotifier* notifier);

    // Install the configured main admin. A delegated entry for the same id
    // is dropped so the registry invariant holds.
    Result<void> set_main_admin(const std::string& user);

    bool is_main_admin(const std::string& user) const;
    bool is_admin(const std::string& user) const;
    std::vector<std::string> admins() const;

    // Only the main admin may change the delegated set.
    Result<void> add_admin(const std::string& actor, const std::string& user);
    Result<void> remove_admin(const std::string& actor, const std::string& user);

    // Grants are managed by the instance owner.
    Result<void> share(const std::string& owner, const std::string& id, const std::string& user);
    Result<void> revoke(const std::string& owner, const std::string& id, const std::string& user);

    // The instance as seen by an authorized caller.
    Result<OwnedInstance> authorize(const std::string& user, const std::string& id,
                                    Action action) const;

    // Admin-only actions that do not target an instance.
    Result<void> require_admin(const std::string& user) const;

private:
    InstanceStore& store_;
    OwnerNotifier* notifier_;
};
