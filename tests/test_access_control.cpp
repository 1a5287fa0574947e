#include "test_support.hpp"
#include "fake_executor.hpp"
#include <managers/access_control.hpp>

class AccessControlTest : public StateDirTest {
protected:
    void SetUp() override {
        StateDirTest::SetUp();
        store = std::make_unique<InstanceStore>(test_dir);
        access = std::make_unique<AccessControl>(*store, &notifier);
        ASSERT_TRUE(access->set_main_admin("root").is_ok());
        add_instance(*store, "alice", make_instance("a1", InstanceStatus::Running));
        add_instance(*store, "alice", make_instance("a2", InstanceStatus::Suspended));
    }

    RecordingNotifier notifier;
    std::unique_ptr<InstanceStore> store;
    std::unique_ptr<AccessControl> access;
};

TEST_F(AccessControlTest, OnlyMainAdminManagesAdmins) {
    ASSERT_TRUE(access->add_admin("root", "ops").is_ok());
    EXPECT_TRUE(access->is_admin("ops"));
    EXPECT_FALSE(access->is_main_admin("ops"));

    EXPECT_EQ(access->add_admin("ops", "dev").kind, ErrorKind::Validation);
    EXPECT_EQ(access->remove_admin("ops", "ops").kind, ErrorKind::Validation);
    EXPECT_EQ(access->add_admin("root", "ops").kind, ErrorKind::Validation);

    ASSERT_TRUE(access->remove_admin("root", "ops").is_ok());
    EXPECT_FALSE(access->is_admin("ops"));
    EXPECT_EQ(access->remove_admin("root", "ops").kind, ErrorKind::NotFound);
}

TEST_F(AccessControlTest, MainAdminCannotBeAddedOrRemoved) {
    EXPECT_EQ(access->add_admin("root", "root").kind, ErrorKind::Validation);
    auto r = access->remove_admin("root", "root");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "cannot remove the main admin");
    EXPECT_TRUE(access->admins().empty());
}

TEST_F(AccessControlTest, SetMainAdminDropsDelegatedEntry) {
    ASSERT_TRUE(access->add_admin("root", "ops").is_ok());
    ASSERT_TRUE(access->set_main_admin("ops").is_ok());
    EXPECT_TRUE(access->is_main_admin("ops"));
    EXPECT_TRUE(access->admins().empty());
}

TEST_F(AccessControlTest, OwnerSharedAndAdminRights) {
    EXPECT_TRUE(access->authorize("alice", "a1", Action::Operate).is_ok());
    EXPECT_TRUE(access->authorize("alice", "a1", Action::Destroy).is_ok());
    EXPECT_EQ(access->authorize("alice", "a1", Action::Administer).kind, ErrorKind::Validation);

    EXPECT_EQ(access->authorize("bob", "a1", Action::Operate).kind, ErrorKind::Validation);
    ASSERT_TRUE(access->share("alice", "a1", "bob").is_ok());
    EXPECT_TRUE(access->authorize("bob", "a1", Action::Operate).is_ok());
    EXPECT_EQ(access->authorize("bob", "a1", Action::Destroy).kind, ErrorKind::Validation);

    EXPECT_TRUE(access->authorize("root", "a1", Action::Administer).is_ok());
    EXPECT_EQ(access->authorize("root", "a1", Action::Destroy).kind, ErrorKind::Validation);
    EXPECT_EQ(access->authorize("root", "ghost", Action::Operate).kind, ErrorKind::NotFound);
}

TEST_F(AccessControlTest, SuspendedBlocksOwnerButNotAdmin) {
    EXPECT_EQ(access->authorize("alice", "a2", Action::Operate).kind, ErrorKind::StateConflict);
    EXPECT_TRUE(access->authorize("root", "a2", Action::Operate).is_ok());
}

TEST_F(AccessControlTest, ShareRules) {
    EXPECT_EQ(access->share("bob", "a1", "carol").kind, ErrorKind::Validation);
    EXPECT_EQ(access->share("alice", "a1", "alice").kind, ErrorKind::Validation);
    ASSERT_TRUE(access->share("alice", "a1", "bob").is_ok());
    EXPECT_EQ(access->share("alice", "a1", "bob").kind, ErrorKind::Validation);

    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_EQ(notifier.sent[0].first, "bob");

    ASSERT_TRUE(access->revoke("alice", "a1", "bob").is_ok());
    EXPECT_EQ(access->revoke("alice", "a1", "bob").kind, ErrorKind::NotFound);
    EXPECT_FALSE(store->find("a1")->instance.is_shared_with("bob"));
}

TEST_F(AccessControlTest, RequireAdmin) {
    EXPECT_TRUE(access->require_admin("root").is_ok());
    EXPECT_EQ(access->require_admin("alice").kind, ErrorKind::Validation);
}
