#include "instance_status.hpp"
#include <fmt/format.h>

const char* status_name(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::Running:   return "running";
        case InstanceStatus::Stopped:   return "stopped";
        case InstanceStatus::Suspended: return "suspended";
    }
    return "unknown";
}

const char* event_name(StatusEvent event) {
    switch (event) {
        case StatusEvent::Start:     return "start";
        case StatusEvent::Stop:      return "stop";
        case StatusEvent::Suspend:   return "suspend";
        case StatusEvent::Unsuspend: return "unsuspend";
    }
    return "unknown";
}

std::optional<InstanceStatus> parse_status(const std::string& text) {
    if (text == "running") return InstanceStatus::Running;
    if (text == "stopped") return InstanceStatus::Stopped;
    if (text == "suspended") return InstanceStatus::Suspended;
    return std::nullopt;
}

bool is_noop_transition(InstanceStatus from, StatusEvent event) {
    return (event == StatusEvent::Start && from == InstanceStatus::Running) ||
           (event == StatusEvent::Stop && from == InstanceStatus::Stopped);
}

Result<InstanceStatus> apply_transition(InstanceStatus from, StatusEvent event) {
    if (is_noop_transition(from, event)) {
        return Result<InstanceStatus>::Ok(from);
    }

    switch (event) {
        case StatusEvent::Start:
            if (from == InstanceStatus::Stopped)
                return Result<InstanceStatus>::Ok(InstanceStatus::Running);
            break;
        case StatusEvent::Stop:
            if (from == InstanceStatus::Running)
                return Result<InstanceStatus>::Ok(InstanceStatus::Stopped);
            break;
        case StatusEvent::Suspend:
            if (from == InstanceStatus::Running)
                return Result<InstanceStatus>::Ok(InstanceStatus::Suspended);
            break;
        case StatusEvent::Unsuspend:
            if (from == InstanceStatus::Suspended)
                return Result<InstanceStatus>::Ok(InstanceStatus::Running);
            break;
    }

    std::string hint;
    if (from == InstanceStatus::Suspended) {
        hint = " (unsuspend it first)";
    } else if (event == StatusEvent::Suspend) {
        hint = " (only running instances can be suspended)";
    } else if (event == StatusEvent::Unsuspend) {
        hint = " (instance is not suspended)";
    }
    return Result<InstanceStatus>::Err(ErrorKind::StateConflict,
        fmt::format("cannot {} an instance that is {}{}", event_name(event), status_name(from), hint));
}
