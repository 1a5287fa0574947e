#include "test_support.hpp"
#include "fake_executor.hpp"
#include <managers/port_allocator.hpp>
#include <set>

class PortAllocatorTest : public StateDirTest {
protected:
    void SetUp() override {
        StateDirTest::SetUp();
        store = std::make_unique<InstanceStore>(test_dir);
        add_instance(*store, "alice", make_instance("web-1", InstanceStatus::Running));
        add_instance(*store, "bob", make_instance("db-1", InstanceStatus::Running));
        ports = std::make_unique<PortAllocator>(*store, exec, PortRange{10000, 10004});
    }

    FakeExecutor exec;
    std::unique_ptr<InstanceStore> store;
    std::unique_ptr<PortAllocator> ports;
};

TEST_F(PortAllocatorTest, AllocatesLowestFreePortWithBothProtocols) {
    ports->add_slots("alice", 2);

    auto r = ports->allocate("alice", "web-1", 80);
    ASSERT_TRUE(r.is_ok()) << r.describe();
    EXPECT_EQ(r.value.host_port, 10000);
    EXPECT_EQ(r.value.internal_port, 80);

    auto cmds = exec.commands();
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(cmds[0], "lxc config device add web-1 port-10000-tcp proxy "
                       "listen=tcp:0.0.0.0:10000 connect=tcp:127.0.0.1:80");
    EXPECT_EQ(cmds[1], "lxc config device add web-1 port-10000-udp proxy "
                       "listen=udp:0.0.0.0:10000 connect=udp:127.0.0.1:80");

    auto second = ports->allocate("alice", "web-1", 443);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value.host_port, 10001);
}

TEST_F(PortAllocatorTest, QuotaExceededRunsNoCommand) {
    ports->add_slots("alice", 1);
    ASSERT_TRUE(ports->allocate("alice", "web-1", 22).is_ok());
    exec.clear();

    auto r = ports->allocate("alice", "web-1", 80);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::QuotaExceeded);
    EXPECT_TRUE(exec.commands().empty());
}

TEST_F(PortAllocatorTest, NoSlotsMeansQuotaExceeded) {
    auto r = ports->allocate("alice", "web-1", 22);
    EXPECT_EQ(r.kind, ErrorKind::QuotaExceeded);
    EXPECT_TRUE(exec.commands().empty());
}

TEST_F(PortAllocatorTest, RejectsBadInternalPortAndUnknownInstance) {
    ports->add_slots("alice", 1);
    EXPECT_EQ(ports->allocate("alice", "web-1", 0).kind, ErrorKind::Validation);
    EXPECT_EQ(ports->allocate("alice", "web-1", 70000).kind, ErrorKind::Validation);
    EXPECT_EQ(ports->allocate("alice", "ghost", 22).kind, ErrorKind::NotFound);
    EXPECT_TRUE(exec.commands().empty());
}

TEST_F(PortAllocatorTest, RangeExhaustion) {
    ports->add_slots("alice", 10);
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(ports->allocate("alice", "web-1", 8000 + i).is_ok());
    }
    auto r = ports->allocate("alice", "web-1", 9000);
    EXPECT_EQ(r.kind, ErrorKind::QuotaExceeded);
}

TEST_F(PortAllocatorTest, UdpFailureRollsBackTcp) {
    ports->add_slots("alice", 1);
    exec.fail("lxc config device add web-1 port-10000-udp", "device exists");

    auto r = ports->allocate("alice", "web-1", 53);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "device exists");
    EXPECT_EQ(exec.count("lxc config device remove web-1 port-10000-tcp"), 1);
    EXPECT_TRUE(ports->list("alice").forwards.empty());
}

TEST_F(PortAllocatorTest, ReleaseFreesPortForReuse) {
    ports->add_slots("alice", 2);
    ports->add_slots("bob", 1);
    ASSERT_TRUE(ports->allocate("alice", "web-1", 22).is_ok());
    ASSERT_TRUE(ports->allocate("bob", "db-1", 5432).is_ok());

    EXPECT_EQ(ports->release("bob", 10000).kind, ErrorKind::NotFound);
    ASSERT_TRUE(ports->release("alice", 10000).is_ok());
    EXPECT_EQ(exec.count("lxc config device remove web-1 port-10000-"), 2);

    auto again = ports->allocate("bob", "db-1", 6379);
    EXPECT_EQ(again.kind, ErrorKind::QuotaExceeded);

    auto reuse = ports->allocate("alice", "web-1", 80);
    ASSERT_TRUE(reuse.is_ok());
    EXPECT_EQ(reuse.value.host_port, 10000);
}

TEST_F(PortAllocatorTest, MappedPortsStayUniqueAndInRange) {
    ports->add_slots("alice", 3);
    ports->add_slots("bob", 3);

    ASSERT_TRUE(ports->allocate("alice", "web-1", 1).is_ok());
    ASSERT_TRUE(ports->allocate("bob", "db-1", 2).is_ok());
    ASSERT_TRUE(ports->allocate("alice", "web-1", 3).is_ok());
    ASSERT_TRUE(ports->release("bob", 10001).is_ok());
    ASSERT_TRUE(ports->allocate("bob", "db-1", 4).is_ok());
    ASSERT_TRUE(ports->allocate("bob", "db-1", 5).is_ok());
    ASSERT_TRUE(ports->release("alice", 10000).is_ok());
    ASSERT_TRUE(ports->allocate("alice", "web-1", 6).is_ok());

    FleetState s = store->snapshot();
    std::set<int> seen;
    for (const auto& [user, list] : s.ports.active) {
        for (const auto& f : list) {
            EXPECT_TRUE(seen.insert(f.host_port).second) << "duplicate " << f.host_port;
            EXPECT_GE(f.host_port, 10000);
            EXPECT_LE(f.host_port, 10004);
        }
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST_F(PortAllocatorTest, DropInstanceForwards) {
    ports->add_slots("alice", 2);
    ASSERT_TRUE(ports->allocate("alice", "web-1", 22).is_ok());
    ASSERT_TRUE(ports->allocate("alice", "web-1", 80).is_ok());

    int dropped = store->mutate([](FleetState& s) {
        return PortAllocator::drop_instance_forwards(s, "web-1");
    });
    EXPECT_EQ(dropped, 2);
    EXPECT_TRUE(ports->list("alice").forwards.empty());
    EXPECT_EQ(ports->list("alice").slots, 2);
}

TEST(PortAllocator, LowestFree) {
    EXPECT_EQ(PortAllocator::lowest_free({10000, 10002}, PortRange{10000, 10002}).value_or(-1), 10001);
    EXPECT_FALSE(PortAllocator::lowest_free({1, 2}, PortRange{1, 2}).has_value());
}
