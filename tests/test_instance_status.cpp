#include <gtest/gtest.h>
#include <core/instance_status.hpp>

TEST(InstanceStatus, NamesRoundTrip) {
    for (auto s : {InstanceStatus::Running, InstanceStatus::Stopped, InstanceStatus::Suspended}) {
        auto parsed = parse_status(status_name(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(parse_status("Running").has_value());
    EXPECT_FALSE(parse_status("").has_value());
}

TEST(InstanceStatus, ValidTransitions) {
    EXPECT_EQ(apply_transition(InstanceStatus::Stopped, StatusEvent::Start).value,
              InstanceStatus::Running);
    EXPECT_EQ(apply_transition(InstanceStatus::Running, StatusEvent::Stop).value,
              InstanceStatus::Stopped);
    EXPECT_EQ(apply_transition(InstanceStatus::Running, StatusEvent::Suspend).value,
              InstanceStatus::Suspended);
    EXPECT_EQ(apply_transition(InstanceStatus::Suspended, StatusEvent::Unsuspend).value,
              InstanceStatus::Running);
}

TEST(InstanceStatus, NoopTransitions) {
    EXPECT_TRUE(is_noop_transition(InstanceStatus::Running, StatusEvent::Start));
    EXPECT_TRUE(is_noop_transition(InstanceStatus::Stopped, StatusEvent::Stop));
    EXPECT_FALSE(is_noop_transition(InstanceStatus::Stopped, StatusEvent::Start));

    auto r = apply_transition(InstanceStatus::Running, StatusEvent::Start);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, InstanceStatus::Running);
}

TEST(InstanceStatus, SuspendedOnlyLeavesThroughUnsuspend) {
    for (auto e : {StatusEvent::Start, StatusEvent::Stop, StatusEvent::Suspend}) {
        auto r = apply_transition(InstanceStatus::Suspended, e);
        ASSERT_TRUE(r.is_err()) << event_name(e);
        EXPECT_EQ(r.kind, ErrorKind::StateConflict);
        EXPECT_NE(r.error.find("unsuspend it first"), std::string::npos);
    }
}

TEST(InstanceStatus, SuspendAndUnsuspendNeedTheRightSource) {
    EXPECT_EQ(apply_transition(InstanceStatus::Stopped, StatusEvent::Suspend).kind,
              ErrorKind::StateConflict);
    EXPECT_EQ(apply_transition(InstanceStatus::Running, StatusEvent::Unsuspend).kind,
              ErrorKind::StateConflict);
    EXPECT_EQ(apply_transition(InstanceStatus::Stopped, StatusEvent::Unsuspend).kind,
              ErrorKind::StateConflict);
}
