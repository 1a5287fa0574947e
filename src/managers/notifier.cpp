#include "notifier.hpp"
#include "log.hpp"
#include <fstream>

InboxNotifier::InboxNotifier(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

Result<void> InboxNotifier::notify(const std::string& user, const std::string& message) {
    if (user.empty()) {
        return Result<void>::Err(ErrorKind::NotFound, "no recipient");
    }
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    std::ofstream f(dir_ / (user + ".log"), std::ios::app);
    if (!f) {
        return Result<void>::Err(ErrorKind::Execution,
                                 "inbox for " + user + " is not writable");
    }
    f << "[" << now_iso() << "] " << message << "\n";
    return Result<void>::Ok();
}

Result<void> LoggingRoleGateway::grant_owner_role(const std::string& user) {
    warden_log("role: grant owner role to " + user);
    return Result<void>::Ok();
}

Result<void> LoggingRoleGateway::revoke_owner_role(const std::string& user) {
    warden_log("role: revoke owner role from " + user);
    return Result<void>::Ok();
}

void notify_best_effort(OwnerNotifier* notifier, const std::string& user,
                        const std::string& message) {
    if (!notifier) return;
    auto r = notifier->notify(user, message);
    if (r.is_err()) {
        warden_log(fmt::format("notify {} failed: {}", user, r.error));
    }
}
