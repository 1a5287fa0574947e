#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Failure categories surfaced to callers of the engine.
enum class ErrorKind {
    None,
    Execution,       // external command failed or timed out
    Validation,      // bad caller input
    QuotaExceeded,   // validation failure: port slot quota used up
    NotFound,        // unknown instance or owner
    StateConflict,   // operation invalid for the current status
    Persistence,     // state could not be written or read
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "Ok";
        case ErrorKind::Execution:     return "ExecutionError";
        case ErrorKind::Validation:    return "ValidationError";
        case ErrorKind::QuotaExceeded: return "QuotaExceeded";
        case ErrorKind::NotFound:      return "NotFoundError";
        case ErrorKind::StateConflict: return "StateConflictError";
        case ErrorKind::Persistence:   return "PersistenceError";
    }
    return "Error";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Carry another result's failure across a type boundary.
    template <typename U>
    static Result<T> Fail(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + error;
    }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Fail(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + error;
    }
};

// Captured outcome of a finished child process
struct CommandOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;

    bool succeeded() const { return !timed_out && exit_code == 0; }
};

// Configuration structures
struct ToolConfig {
    std::string tool = "lxc";              // name on PATH or explicit path
    std::string image = "ubuntu:22.04";
    std::string storage_pool = "default";
    std::string instance_prefix = "warden";
    int command_timeout = 120;             // seconds
};

struct GuardianConfig {
    int cpu_threshold = 90;                // percent
    int ram_threshold = 90;                // percent
    int host_check_interval = 60;          // seconds
    int instance_check_interval = 600;     // seconds
    bool host_guardian_enabled = true;
};

struct PortRange {
    int first = 10000;
    int last = 19999;

    bool contains(int port) const { return port >= first && port <= last; }
};

