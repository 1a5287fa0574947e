#include "access_control.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <algorithm>

const char* action_name(Action action) {
    switch (action) {
        case Action::Operate:    return "operate";
        case Action::Destroy:    return "destroy";
        case Action::Administer: return "administer";
    }
    return "unknown";
}

AccessControl::AccessControl(InstanceStore& store, OwnerNotifier* notifier)
    : store_(store), notifier_(notifier) {}

Result<void> AccessControl::set_main_admin(const std::string& user) {
    if (user.empty()) return Result<void>::Ok();
    bool changed = false;
    store_.mutate([&](FleetState& s) {
        auto& list = s.admins.admins;
        auto before = list.size();
        list.erase(std::remove(list.begin(), list.end(), user), list.end());
        changed = s.admins.main_admin != user || list.size() != before;
        s.admins.main_admin = user;
    });
    if (!changed) return Result<void>::Ok();
    return store_.save();
}

bool AccessControl::is_main_admin(const std::string& user) const {
    return store_.mutate([&](FleetState& s) { return s.admins.is_main_admin(user); });
}

bool AccessControl::is_admin(const std::string& user) const {
    return store_.mutate([&](FleetState& s) { return s.admins.is_admin(user); });
}

std::vector<std::string> AccessControl::admins() const {
    return store_.mutate([](FleetState& s) { return s.admins.admins; });
}

Result<void> AccessControl::require_admin(const std::string& user) const {
    if (!is_admin(user)) {
        return Result<void>::Err(ErrorKind::Validation, "this action requires admin rights");
    }
    return Result<void>::Ok();
}

Result<void> AccessControl::add_admin(const std::string& actor, const std::string& user) {
    auto r = store_.mutate([&](FleetState& s) -> Result<void> {
        if (!s.admins.is_main_admin(actor)) {
            return Result<void>::Err(ErrorKind::Validation, "only the main admin can add admins");
        }
        if (user.empty()) {
            return Result<void>::Err(ErrorKind::Validation, "admin id must not be empty");
        }
        if (s.admins.is_main_admin(user)) {
            return Result<void>::Err(ErrorKind::Validation, "the main admin is always an admin");
        }
        if (s.admins.is_admin(user)) {
            return Result<void>::Err(ErrorKind::Validation,
                                     fmt::format("{} is already an admin", user));
        }
        s.admins.admins.push_back(user);
        return Result<void>::Ok();
    });
    if (r.is_err()) return r;
    warden_log(fmt::format("access: {} added admin {}", actor, user));
    return store_.save();
}

Result<void> AccessControl::remove_admin(const std::string& actor, const std::string& user) {
    auto r = store_.mutate([&](FleetState& s) -> Result<void> {
        if (!s.admins.is_main_admin(actor)) {
            return Result<void>::Err(ErrorKind::Validation, "only the main admin can remove admins");
        }
        if (s.admins.is_main_admin(user)) {
            return Result<void>::Err(ErrorKind::Validation, "cannot remove the main admin");
        }
        auto& list = s.admins.admins;
        auto it = std::find(list.begin(), list.end(), user);
        if (it == list.end()) {
            return Result<void>::Err(ErrorKind::NotFound, fmt::format("{} is not an admin", user));
        }
        list.erase(it);
        return Result<void>::Ok();
    });
    if (r.is_err()) return r;
    warden_log(fmt::format("access: {} removed admin {}", actor, user));
    return store_.save();
}

Result<void> AccessControl::share(const std::string& owner, const std::string& id,
                                  const std::string& user) {
    auto r = store_.mutate([&](FleetState& s) -> Result<void> {
        std::string actual_owner;
        Instance* inst = s.find(id, &actual_owner);
        if (!inst) {
            return Result<void>::Err(ErrorKind::NotFound, fmt::format("instance '{}' not found", id));
        }
        if (actual_owner != owner) {
            return Result<void>::Err(ErrorKind::Validation, "only the owner can share an instance");
        }
        if (user.empty() || user == owner) {
            return Result<void>::Err(ErrorKind::Validation, "cannot share an instance with its owner");
        }
        if (inst->is_shared_with(user)) {
            return Result<void>::Err(ErrorKind::Validation,
                                     fmt::format("{} already has access to {}", user, id));
        }
        inst->shared_with.push_back(user);
        return Result<void>::Ok();
    });
    if (r.is_err()) return r;

    auto saved = store_.save();
    if (saved.is_err()) return saved;
    notify_best_effort(notifier_, user,
        fmt::format("{} shared instance {} with you", owner, id));
    return Result<void>::Ok();
}

Result<void> AccessControl::revoke(const std::string& owner, const std::string& id,
                                   const std::string& user) {
    auto r = store_.mutate([&](FleetState& s) -> Result<void> {
        std::string actual_owner;
        Instance* inst = s.find(id, &actual_owner);
        if (!inst) {
            return Result<void>::Err(ErrorKind::NotFound, fmt::format("instance '{}' not found", id));
        }
        if (actual_owner != owner) {
            return Result<void>::Err(ErrorKind::Validation, "only the owner can revoke access");
        }
        auto& list = inst->shared_with;
        auto it = std::find(list.begin(), list.end(), user);
        if (it == list.end()) {
            return Result<void>::Err(ErrorKind::NotFound,
                                     fmt::format("{} has no access to {}", user, id));
        }
        list.erase(it);
        return Result<void>::Ok();
    });
    if (r.is_err()) return r;

    auto saved = store_.save();
    if (saved.is_err()) return saved;
    notify_best_effort(notifier_, user,
        fmt::format("Your access to instance {} was revoked by {}", id, owner));
    return Result<void>::Ok();
}

Result<OwnedInstance> AccessControl::authorize(const std::string& user, const std::string& id,
                                               Action action) const {
    return store_.mutate([&](FleetState& s) -> Result<OwnedInstance> {
        std::string owner;
        const Instance* inst = s.find(id, &owner);
        if (!inst) {
            return Result<OwnedInstance>::Err(ErrorKind::NotFound,
                                              fmt::format("instance '{}' not found", id));
        }

        bool admin = s.admins.is_admin(user);
        bool allowed = false;
        switch (action) {
            case Action::Operate:
                allowed = admin || owner == user || inst->is_shared_with(user);
                break;
            case Action::Destroy:
                allowed = owner == user;
                break;
            case Action::Administer:
                allowed = admin;
                break;
        }
        if (!allowed) {
            return Result<OwnedInstance>::Err(ErrorKind::Validation,
                fmt::format("{} may not {} instance {}", user, action_name(action), id));
        }
        if (action == Action::Operate && !admin && inst->suspended()) {
            return Result<OwnedInstance>::Err(ErrorKind::StateConflict,
                fmt::format("instance {} is suspended; contact an admin", id));
        }
        return Result<OwnedInstance>::Ok(OwnedInstance{owner, *inst});
    });
}
