#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Fire-and-forget message delivery to a user. Callers go through
// notify_best_effort(), which logs failures and never propagates them.
class OwnerNotifier {
public:
    virtual ~OwnerNotifier() = default;
    virtual Result<void> notify(const std::string& user, const std::string& message) = 0;
};

// Appends to <dir>/<user>.log
class InboxNotifier : public OwnerNotifier {
public:
    explicit InboxNotifier(std::filesystem::path dir);
    Result<void> notify(const std::string& user, const std::string& message) override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
};

// Grants and revokes the "instance owner" role on the front end.
class RoleGateway {
public:
    virtual ~RoleGateway() = default;
    virtual Result<void> grant_owner_role(const std::string& user) = 0;
    virtual Result<void> revoke_owner_role(const std::string& user) = 0;
};

// No front end attached: record role changes in the log.
class LoggingRoleGateway : public RoleGateway {
public:
    Result<void> grant_owner_role(const std::string& user) override;
    Result<void> revoke_owner_role(const std::string& user) override;
};

void notify_best_effort(OwnerNotifier* notifier, const std::string& user,
                        const std::string& message);
