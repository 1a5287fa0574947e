#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Lifecycle status of an instance. Status is the single source of truth;
// "suspended" is never tracked separately.
enum class InstanceStatus {
    Running,
    Stopped,
    Suspended,
};

// Events that drive status transitions.
enum class StatusEvent {
    Start,      // stopped -> running
    Stop,       // running -> stopped
    Suspend,    // running -> suspended
    Unsuspend,  // suspended -> running
};

const char* status_name(InstanceStatus status);
const char* event_name(StatusEvent event);

// "running" / "stopped" / "suspended". Returns nullopt for anything else.
std::optional<InstanceStatus> parse_status(const std::string& text);

// Apply an event to a status. Start on a running instance and Stop on a
// stopped one are no-ops that return the same status; every other
// transition from an invalid source state is a StateConflict.
Result<InstanceStatus> apply_transition(InstanceStatus from, StatusEvent event);

// True when the event leaves the status unchanged without error.
bool is_noop_transition(InstanceStatus from, StatusEvent event);
