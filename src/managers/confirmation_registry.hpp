#pragma once

#include <string>
#include <map>
#include <mutex>
#include <random>
#include <chrono>
#include <functional>
#include <core/types.hpp>

enum class PendingAction {
    Reinstall,
    StopAll,
};

const char* pending_action_name(PendingAction action);

struct PendingConfirmation {
    std::string handle;             // 16 hex characters
    PendingAction action = PendingAction::Reinstall;
    std::string requester;
    std::string target;             // instance id, empty for stop-all
    std::chrono::steady_clock::time_point expires;
};

// Two-phase protocol for destructive actions. request() hands out a
// short-lived handle; confirm() or cancel() by the same user consumes it.
class ConfirmationRegistry {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ConfirmationRegistry(int ttl_secs, Clock clock = nullptr,
                                  unsigned seed = std::random_device{}());

    PendingConfirmation request(PendingAction action, const std::string& requester,
                                const std::string& target);

    // Consume the handle and return what was pending. Unknown or expired
    // handles are NotFound; another user's handle is a Validation error
    // and stays pending.
    Result<PendingConfirmation> confirm(const std::string& handle, const std::string& user);
    Result<PendingConfirmation> cancel(const std::string& handle, const std::string& user);

    // Drop expired entries. Returns how many were dropped.
    size_t purge_expired();
    size_t pending_count() const;

    int ttl_secs() const { return ttl_secs_; }

private:
    Result<PendingConfirmation> take(const std::string& handle, const std::string& user);
    std::string new_handle();

    int ttl_secs_;
    Clock clock_;
    std::mt19937_64 rng_;
    std::map<std::string, PendingConfirmation> pending_;
    mutable std::mutex mutex_;
};
