#include "runtime/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace cortex::runtime {

using core::errors::CortexError;
using core::errors::ErrorCategory;

namespace {

struct SpawnedProcess {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

void close_quietly(const int fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Kills the whole process group so agent helpers holding our pipes die too.
void kill_group(const pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno == ESRCH) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

core::errors::Result<SpawnedProcess> spawn_process(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        return CortexError{ErrorCategory::Input, "Command cannot be empty.",
                           "empty_command"};
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    // Close-on-exec from creation: concurrent spawns must not leak pipe ends into
    // sibling agents. dup2 onto stdout/stderr clears the flag in the child.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_quietly(stdout_pipe[0]);
        close_quietly(stdout_pipe[1]);
        close_quietly(stderr_pipe[0]);
        close_quietly(stderr_pipe[1]);
        close_quietly(exec_pipe[0]);
        close_quietly(exec_pipe[1]);
        return CortexError{ErrorCategory::Execution, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_quietly(stdout_pipe[0]);
        close_quietly(stdout_pipe[1]);
        close_quietly(stderr_pipe[0]);
        close_quietly(stderr_pipe[1]);
        close_quietly(exec_pipe[0]);
        close_quietly(exec_pipe[1]);
        return CortexError{ErrorCategory::Execution, "Failed to fork process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        // exec_pipe[1] closes on a successful exec; otherwise it carries errno.
        execvp(c_argv[0], c_argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(exec_pipe[0]));

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        return CortexError{ErrorCategory::Execution,
                           "Failed to start '" + argv.front() +
                               "': " + std::strerror(exec_errno),
                           "spawn_failed",
                           "Check that the agent binary is installed and on PATH."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    return SpawnedProcess{pid, stdout_pipe[0], stderr_pipe[0]};
}

}  // namespace

core::errors::Result<ProcessCapture> PosixProcessRunner::run(
    const std::vector<std::string>& argv, const std::uint64_t timeout_ms) const {
    const auto started = std::chrono::steady_clock::now();
    auto spawned = spawn_process(argv);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const SpawnedProcess process = core::errors::get_value(spawned);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool deadline_passed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!deadline_passed && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms)) {
            deadline_passed = true;
            capture.timed_out = !child_exited;
            kill_group(process.pid);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = process.stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = process.stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(10000));
        }

        drain_pipe(process.stdout_fd, stdout_open, capture.stdout_text);
        drain_pipe(process.stderr_fd, stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(process.pid, &status, WNOHANG);
            if (waited == process.pid) {
                child_exited = true;
            }
        }

        // Descendants that outlive the deadline while holding our pipes must not hang us.
        if (child_exited && deadline_passed) {
            if (stdout_open) {
                static_cast<void>(close(process.stdout_fd));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(process.stderr_fd));
                stderr_open = false;
            }
        }

        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
    }

    capture.exit_code = decode_status(status);

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

core::errors::Result<int> PosixProcessRunner::stream(
    const std::vector<std::string>& argv, const LineCallback& on_line) const {
    auto spawned = spawn_process(argv);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const SpawnedProcess process = core::errors::get_value(spawned);

    bool stdout_open = true;
    bool stderr_open = true;
    std::string pending;
    std::string stderr_sink;

    auto emit_complete_lines = [&pending, &on_line]() {
        std::size_t newline = pending.find('\n');
        while (newline != std::string::npos) {
            std::string line = pending.substr(0, newline);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            pending.erase(0, newline + 1);
            if (on_line) {
                on_line(line);
            }
            newline = pending.find('\n');
        }
    };

    while (stdout_open || stderr_open) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = process.stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = process.stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, 100));

        drain_pipe(process.stdout_fd, stdout_open, pending);
        emit_complete_lines();
        drain_pipe(process.stderr_fd, stderr_open, stderr_sink);
    }

    if (!pending.empty() && on_line) {
        on_line(pending);
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(process.pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    return decode_status(status);
}

}  // namespace cortex::runtime
