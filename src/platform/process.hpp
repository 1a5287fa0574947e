#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process. When spawned with captured
// output, the child's stdout and stderr are readable through pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code.
    // timeout_ms = -1 means indefinite wait. Returns -1 on timeout.
    int wait(int timeout_ms = -1);

    // Drain stdout/stderr until both pipes close or the deadline passes.
    // Returns false if the deadline was hit.
    bool collect(std::string& out, std::string& err, int timeout_ms);

    // SIGTERM, then SIGKILL after the grace period.
    void terminate();

private:
    void close_pipes();

    int pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool capture_output);
};

// Spawn a child process with stdin closed. With capture_output the child's
// stdout and stderr go to pipes read by collect().
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output = false);

// Spawn, capture both streams and wait. A child still running after
// timeout_ms is terminated and the result is marked timed_out.
// exit_code is 127 when the program could not be executed.
CommandOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           int timeout_ms);

} // namespace platform
