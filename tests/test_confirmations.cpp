#include "test_support.hpp"
#include <managers/confirmation_registry.hpp>
#include <chrono>

class ConfirmationTest : public StateDirTest {
protected:
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} +
                                                std::chrono::hours(1);
    ConfirmationRegistry registry{60, [this] { return now; }, 42};

    void advance(int secs) { now += std::chrono::seconds(secs); }
};

TEST_F(ConfirmationTest, HandleIsSixteenHexChars) {
    auto p = registry.request(PendingAction::Reinstall, "alice", "a1");
    EXPECT_EQ(p.handle.size(), 16u);
    EXPECT_EQ(p.handle.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(registry.pending_count(), 1u);
}

TEST_F(ConfirmationTest, HandlesAreDistinct) {
    auto a = registry.request(PendingAction::Reinstall, "alice", "a1");
    auto b = registry.request(PendingAction::Reinstall, "alice", "a1");
    EXPECT_NE(a.handle, b.handle);
}

TEST_F(ConfirmationTest, ConfirmIsSingleUse) {
    auto p = registry.request(PendingAction::StopAll, "root", "");
    auto first = registry.confirm(p.handle, "root");
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value.action, PendingAction::StopAll);

    auto second = registry.confirm(p.handle, "root");
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::NotFound);
}

TEST_F(ConfirmationTest, ExpiresAfterTtl) {
    auto p = registry.request(PendingAction::Reinstall, "alice", "a1");
    advance(59);
    EXPECT_EQ(registry.pending_count(), 1u);
    advance(1);

    auto r = registry.confirm(p.handle, "alice");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
    EXPECT_EQ(registry.pending_count(), 0u);
}

TEST_F(ConfirmationTest, OtherUserCannotConfirm) {
    auto p = registry.request(PendingAction::Reinstall, "alice", "a1");
    auto r = registry.confirm(p.handle, "mallory");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Validation);

    // Still pending for the requester
    auto ok = registry.confirm(p.handle, "alice");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value.target, "a1");
}

TEST_F(ConfirmationTest, CancelConsumesHandle) {
    auto p = registry.request(PendingAction::Reinstall, "alice", "a1");
    ASSERT_TRUE(registry.cancel(p.handle, "alice").is_ok());
    EXPECT_EQ(registry.confirm(p.handle, "alice").kind, ErrorKind::NotFound);
}

TEST_F(ConfirmationTest, PurgeDropsOnlyExpired) {
    registry.request(PendingAction::Reinstall, "alice", "a1");
    advance(30);
    registry.request(PendingAction::Reinstall, "bob", "b1");
    advance(40);

    EXPECT_EQ(registry.purge_expired(), 1u);
    EXPECT_EQ(registry.pending_count(), 1u);
}

TEST(PendingAction, Names) {
    EXPECT_STREQ(pending_action_name(PendingAction::Reinstall), "reinstall");
    EXPECT_STREQ(pending_action_name(PendingAction::StopAll), "stop-all");
}
