#include "confirmation_registry.hpp"
#include "log.hpp"
#include <fmt/format.h>

const char* pending_action_name(PendingAction action) {
    switch (action) {
        case PendingAction::Reinstall: return "reinstall";
        case PendingAction::StopAll:   return "stop-all";
    }
    return "unknown";
}

ConfirmationRegistry::ConfirmationRegistry(int ttl_secs, Clock clock, unsigned seed)
    : ttl_secs_(ttl_secs),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      rng_(seed) {}

std::string ConfirmationRegistry::new_handle() {
    std::string handle;
    do {
        handle = fmt::format("{:016x}", rng_());
    } while (pending_.count(handle));
    return handle;
}

PendingConfirmation ConfirmationRegistry::request(PendingAction action,
                                                  const std::string& requester,
                                                  const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    PendingConfirmation p;
    p.handle = new_handle();
    p.action = action;
    p.requester = requester;
    p.target = target;
    p.expires = clock_() + std::chrono::seconds(ttl_secs_);
    pending_[p.handle] = p;
    warden_log(fmt::format("confirm: {} requested {} {} as {}", requester,
                           pending_action_name(action), target, p.handle));
    return p;
}

Result<PendingConfirmation> ConfirmationRegistry::take(const std::string& handle,
                                                       const std::string& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(handle);
    if (it == pending_.end()) {
        return Result<PendingConfirmation>::Err(ErrorKind::NotFound,
            fmt::format("no pending confirmation '{}'", handle));
    }
    if (clock_() >= it->second.expires) {
        pending_.erase(it);
        return Result<PendingConfirmation>::Err(ErrorKind::NotFound,
            fmt::format("confirmation '{}' has expired", handle));
    }
    if (it->second.requester != user) {
        return Result<PendingConfirmation>::Err(ErrorKind::Validation,
            "only the user who requested this action can resolve it");
    }
    PendingConfirmation p = it->second;
    pending_.erase(it);
    return Result<PendingConfirmation>::Ok(p);
}

Result<PendingConfirmation> ConfirmationRegistry::confirm(const std::string& handle,
                                                          const std::string& user) {
    return take(handle, user);
}

Result<PendingConfirmation> ConfirmationRegistry::cancel(const std::string& handle,
                                                         const std::string& user) {
    auto r = take(handle, user);
    if (r.is_ok()) {
        warden_log(fmt::format("confirm: {} cancelled {}", user, handle));
    }
    return r;
}

size_t ConfirmationRegistry::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    size_t dropped = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now >= it->second.expires) {
            it = pending_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t ConfirmationRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}
