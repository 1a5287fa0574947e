#include "test_support.hpp"
#include <core/constants.hpp>
#include <fstream>
#include <iterator>

class InstanceStoreTest : public StateDirTest {
protected:
    void write_state(const std::string& name, const std::string& content) {
        std::ofstream(test_dir / name) << content;
    }
};

TEST_F(InstanceStoreTest, MissingFilesLoadEmpty) {
    InstanceStore store(test_dir);
    ASSERT_TRUE(store.load().is_ok());
    EXPECT_EQ(store.snapshot().instance_count(), 0u);
    EXPECT_TRUE(store.snapshot().admins.main_admin.empty());
}

TEST_F(InstanceStoreTest, ReloadAndSaveIsByteIdentical) {
    {
        InstanceStore store(test_dir);
        Instance inst = make_instance("vm-vps-alice-1", InstanceStatus::Suspended, 8, 4, 40);
        inst.suspension_history.push_back({"2025-01-15T11:00:00", "CPU exceeded", "auto-system"});
        inst.suspension_history.push_back({"2025-01-16T09:30:00", "mining: yes", "root"});
        inst.shared_with = {"bob", "carol"};
        add_instance(store, "alice", inst);
        add_instance(store, "bob", make_instance("vm-vps-bob-1", InstanceStatus::Stopped));
        ASSERT_TRUE(store.commit([](FleetState& s) {
            s.admins.main_admin = "root";
            s.admins.admins = {"ops"};
            s.ports.slots["alice"] = 2;
            s.ports.active["alice"].push_back({"vm-vps-alice-1", 22, 10001});
        }).is_ok());
    }

    auto read_all = [this] {
        std::string all;
        for (const char* name : {INSTANCES_FILE, ADMINS_FILE, PORTS_FILE}) {
            std::ifstream in(test_dir / name);
            EXPECT_TRUE(in.good()) << name;
            all += std::string(std::istreambuf_iterator<char>(in), {});
            all += "\n--\n";
        }
        return all;
    };
    const std::string first = read_all();

    InstanceStore reloaded(test_dir);
    ASSERT_TRUE(reloaded.load().is_ok());
    ASSERT_TRUE(reloaded.save().is_ok());
    EXPECT_EQ(read_all(), first);
}

TEST_F(InstanceStoreTest, SaveThenLoadPreservesRecords) {
    {
        InstanceStore store(test_dir);
        Instance inst = make_instance("vm-vps-alice-1", InstanceStatus::Suspended, 8, 4, 40);
        inst.suspension_history.push_back({"2025-01-15T11:00:00", "CPU exceeded", "auto-system"});
        inst.shared_with = {"bob"};
        add_instance(store, "alice", inst);
        add_instance(store, "alice", make_instance("vm-vps-alice-2", InstanceStatus::Running));

        ASSERT_TRUE(store.commit([](FleetState& s) {
            s.admins.main_admin = "root";
            s.admins.admins = {"ops"};
            s.ports.slots["alice"] = 3;
            s.ports.active["alice"].push_back({"vm-vps-alice-2", 22, 10000});
        }).is_ok());
    }

    InstanceStore reloaded(test_dir);
    ASSERT_TRUE(reloaded.load().is_ok());
    FleetState s = reloaded.snapshot();

    ASSERT_EQ(s.instances["alice"].size(), 2u);
    const Instance& first = s.instances["alice"][0];
    EXPECT_EQ(first.id, "vm-vps-alice-1");
    EXPECT_EQ(first.resources, (ResourceSpec{8, 4, 40}));
    EXPECT_EQ(first.config, "8GB RAM / 4 CPU / 40GB Disk");
    EXPECT_EQ(first.status, InstanceStatus::Suspended);
    EXPECT_TRUE(first.suspended());
    ASSERT_EQ(first.suspension_history.size(), 1u);
    EXPECT_EQ(first.suspension_history[0].reason, "CPU exceeded");
    EXPECT_EQ(first.suspension_history[0].actor, "auto-system");
    EXPECT_TRUE(first.is_shared_with("bob"));
    EXPECT_EQ(s.instances["alice"][1].status, InstanceStatus::Running);

    EXPECT_EQ(s.admins.main_admin, "root");
    EXPECT_TRUE(s.admins.is_admin("ops"));
    EXPECT_EQ(s.ports.slots_for("alice"), 3);
    ASSERT_EQ(s.ports.active["alice"].size(), 1u);
    EXPECT_EQ(s.ports.active["alice"][0].host_port, 10000);
    EXPECT_EQ(s.ports.active["alice"][0].internal_port, 22);
}

TEST_F(InstanceStoreTest, SaveLeavesNoTempFiles) {
    InstanceStore store(test_dir);
    add_instance(store, "alice", make_instance("a1", InstanceStatus::Running));

    EXPECT_TRUE(fs::exists(test_dir / INSTANCES_FILE));
    EXPECT_TRUE(fs::exists(test_dir / ADMINS_FILE));
    EXPECT_TRUE(fs::exists(test_dir / PORTS_FILE));
    for (const auto& entry : fs::directory_iterator(test_dir)) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
    }
}

TEST_F(InstanceStoreTest, LegacySuspendedFlagWins) {
    write_state(INSTANCES_FILE,
        "alice:\n"
        "  - container_name: old-1\n"
        "    ram: 2GB\n"
        "    cpu: \"1\"\n"
        "    storage: 10GB\n"
        "    status: stopped\n"
        "    suspended: true\n");

    InstanceStore store(test_dir);
    ASSERT_TRUE(store.load().is_ok());
    auto found = store.find("old-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->instance.status, InstanceStatus::Suspended);
    EXPECT_EQ(found->instance.config, "2GB RAM / 1 CPU / 10GB Disk");
}

TEST_F(InstanceStoreTest, UnknownStatusLoadsStopped) {
    write_state(INSTANCES_FILE,
        "alice:\n"
        "  - container_name: odd-1\n"
        "    ram: 2GB\n"
        "    cpu: \"1\"\n"
        "    storage: 10GB\n"
        "    status: frozen\n");

    InstanceStore store(test_dir);
    ASSERT_TRUE(store.load().is_ok());
    EXPECT_EQ(store.find("odd-1")->instance.status, InstanceStatus::Stopped);
}

TEST_F(InstanceStoreTest, CorruptDocumentIsPersistenceError) {
    InstanceStore store(test_dir);
    add_instance(store, "alice", make_instance("keep-1", InstanceStatus::Running));

    write_state(INSTANCES_FILE, "alice: [unterminated\n");
    auto r = store.load();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Persistence);

    // In-memory state untouched
    EXPECT_TRUE(store.exists("keep-1"));
}

TEST_F(InstanceStoreTest, NonMappingRootIsPersistenceError) {
    write_state(ADMINS_FILE, "- just\n- a list\n");
    InstanceStore store(test_dir);
    auto r = store.load();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Persistence);
}

TEST_F(InstanceStoreTest, AdminsDropMainAdminAndDuplicates) {
    auto r = decode_admins("main_admin: root\nadmins: [ops, root, ops, dev]\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.admins, (std::vector<std::string>{"ops", "dev"}));
}

TEST_F(InstanceStoreTest, ResolveNumber) {
    InstanceStore store(test_dir);
    add_instance(store, "alice", make_instance("a1", InstanceStatus::Running));
    add_instance(store, "alice", make_instance("a2", InstanceStatus::Stopped));

    EXPECT_EQ(store.resolve_number("alice", 2).value, "a2");
    EXPECT_EQ(store.resolve_number("alice", 3).kind, ErrorKind::Validation);
    EXPECT_EQ(store.resolve_number("bob", 1).kind, ErrorKind::NotFound);
}

TEST_F(InstanceStoreTest, EraseDropsEmptyOwner) {
    FleetState s;
    s.instances["alice"].push_back(make_instance("a1", InstanceStatus::Running));
    EXPECT_TRUE(s.erase("a1"));
    EXPECT_EQ(s.instances.count("alice"), 0u);
    EXPECT_FALSE(s.erase("a1"));
}

TEST_F(InstanceStoreTest, StopAllRunningLeavesOthers) {
    FleetState s;
    s.instances["alice"].push_back(make_instance("a1", InstanceStatus::Running));
    s.instances["alice"].push_back(make_instance("a2", InstanceStatus::Suspended));
    s.instances["bob"].push_back(make_instance("b1", InstanceStatus::Running));
    s.instances["bob"].push_back(make_instance("b2", InstanceStatus::Stopped));

    EXPECT_EQ(s.stop_all_running(), 2);
    EXPECT_EQ(s.find("a1")->status, InstanceStatus::Stopped);
    EXPECT_EQ(s.find("a2")->status, InstanceStatus::Suspended);
    EXPECT_EQ(s.find("b1")->status, InstanceStatus::Stopped);
}
