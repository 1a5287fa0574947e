#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

namespace platform {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    if (stdout_fd_ >= 0) { close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { close(stderr_fd_); stderr_fd_ = -1; }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        while (waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        reaped_ = true;
        exit_code_ = decode_status(status);
        return exit_code_;
    }

    // Poll with timeout
    int elapsed = 0;
    while (true) {
        if (!running()) return reaped_ ? exit_code_ : -1;
        if (elapsed >= timeout_ms) break;
        sleep_ms(GUARDIAN_SLEEP_SLICE_MS);
        elapsed += GUARDIAN_SLEEP_SLICE_MS;
    }
    return -1;  // timed out
}

bool ProcessHandle::collect(std::string& out, std::string& err, int timeout_ms) {
    long long deadline = now_ms() + timeout_ms;
    char buf[4096];

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        long long remaining = deadline - now_ms();
        if (remaining <= 0) return false;

        struct pollfd fds[2];
        int n = 0;
        int out_idx = -1, err_idx = -1;
        if (stdout_fd_ >= 0) { fds[n] = {stdout_fd_, POLLIN, 0}; out_idx = n++; }
        if (stderr_fd_ >= 0) { fds[n] = {stderr_fd_, POLLIN, 0}; err_idx = n++; }

        int rc = poll(fds, n, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            close_pipes();
            return true;
        }
        if (rc == 0) return false;

        auto drain = [&](int idx, int& fd, std::string& sink) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t got = read(fd, buf, sizeof(buf));
            if (got > 0) {
                sink.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close(fd);
                fd = -1;
            }
        };
        drain(out_idx, stdout_fd_, out);
        drain(err_idx, stderr_fd_, err);
    }
    return true;
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait for graceful exit
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += GUARDIAN_SLEEP_SLICE_MS) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return;
        }
        sleep_ms(GUARDIAN_SLEEP_SLICE_MS);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_code_ = decode_status(status);
    }
    reaped_ = true;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (capture_output) {
        // Close-on-exec so children forked by other threads never hold our write ends
        if (pipe2(out_pipe, O_CLOEXEC) != 0) return handle;
        if (pipe2(err_pipe, O_CLOEXEC) != 0) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            return handle;
        }
    }

    // Build argv before forking
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        } else {
            close(STDIN_FILENO);
        }

        if (capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    if (capture_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
        handle.stderr_fd_ = err_pipe[0];
    }
    return handle;
}

CommandOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           int timeout_ms) {
    CommandOutput result;

    ProcessHandle proc = spawn(program, args, true);
    if (!proc.valid()) {
        result.exit_code = 127;
        result.stderr_data = "failed to spawn " + program;
        return result;
    }

    long long started = now_ms();
    bool drained = proc.collect(result.stdout_data, result.stderr_data, timeout_ms);

    int remaining = static_cast<int>(timeout_ms - (now_ms() - started));
    // Pipes close just before exit, so allow at least one poll slice.
    if (remaining < GUARDIAN_SLEEP_SLICE_MS) remaining = GUARDIAN_SLEEP_SLICE_MS;
    int code = drained ? proc.wait(remaining) : -1;
    if (!drained || (code == -1 && proc.running())) {
        proc.terminate();
        result.timed_out = true;
        result.exit_code = -1;
        return result;
    }

    result.exit_code = code;
    return result;
}

} // namespace platform
