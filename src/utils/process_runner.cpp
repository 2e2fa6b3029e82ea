/**
 * @file process_runner.cpp
 * @brief fork/exec process runner with separate stdout/stderr capture
 *
 * **Spawn sequence**:
 * ```
 * pipe(stdout) pipe(stderr) pipe(exec-error, CLOEXEC)
 * fork
 *   child:  setsid, dup2 pipes, stdin </dev/null, execvp
 *           on failure write errno to exec-error pipe, _exit(127)
 *   parent: read exec-error pipe (EOF means exec succeeded)
 *           poll both output pipes until EOF or deadline
 *           deadline: kill(-pgid, SIGKILL)
 *           reap with waitpid
 * ```
 *
 * @date 2025
 */

#include "repobox/utils/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace repobox {
namespace utils {

namespace {

using Clock = std::chrono::steady_clock;

// Time allowed for pipes to reach EOF once the group has been killed.
constexpr std::chrono::milliseconds kDrainGrace{1000};

std::string ErrnoMessage(const std::string& prefix, int err) {
    return prefix + ": " + std::strerror(err);
}

void CloseFd(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief Owns the three pipes used by one spawn
 */
struct Pipes {
    int out[2]{-1, -1};
    int err[2]{-1, -1};
    int exec_error[2]{-1, -1};

    ~Pipes() {
        for (int* fds : {out, err, exec_error}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
    }
};

void AppendCapped(std::string& target, const char* data, std::size_t len,
                  std::size_t cap, bool& truncated) {
    if (target.size() >= cap) {
        truncated = truncated || len > 0;
        return;
    }
    std::size_t room = cap - target.size();
    if (len > room) {
        truncated = true;
        len = room;
    }
    target.append(data, len);
}

// Only async-signal-safe calls between fork and _exit, so @p args is
// built by the parent.
[[noreturn]] void ChildExec(char* const* args, Pipes& pipes) {
    int err = 0;
    if (setsid() == -1) {
        err = errno;
    }

    if (err == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull == -1 ||
            dup2(devnull, STDIN_FILENO) == -1 ||
            dup2(pipes.out[1], STDOUT_FILENO) == -1 ||
            dup2(pipes.err[1], STDERR_FILENO) == -1) {
            err = errno;
        }
    }

    if (err == 0) {
        execvp(args[0], args);
        err = errno;
    }

    ssize_t written = write(pipes.exec_error[1], &err, sizeof(err));
    (void)written;
    _exit(127);
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::runtime_error("ProcessRunner: empty argv");
    }

    std::vector<char*> args(argv.size() + 1, nullptr);
    for (std::size_t i = 0; i < argv.size(); ++i) {
        args[i] = const_cast<char*>(argv[i].c_str());
    }

    Pipes pipes;
    if (pipe2(pipes.out, O_CLOEXEC) == -1 ||
        pipe2(pipes.err, O_CLOEXEC) == -1 ||
        pipe2(pipes.exec_error, O_CLOEXEC) == -1) {
        throw std::runtime_error(ErrnoMessage("pipe2", errno));
    }

    const auto start = Clock::now();
    pid_t pid = fork();
    if (pid == -1) {
        throw std::runtime_error(ErrnoMessage("fork", errno));
    }
    if (pid == 0) {
        ChildExec(args.data(), pipes);
    }

    CloseFd(pipes.out[1]);
    CloseFd(pipes.err[1]);
    CloseFd(pipes.exec_error[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(pipes.exec_error[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        throw std::runtime_error(ErrnoMessage("execvp(" + argv[0] + ")", child_errno));
    }

    ProcessResult result;
    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;
    auto drain_deadline = Clock::time_point::max();

    std::array<char, 8192> buffer;
    while (pipes.out[0] != -1 || pipes.err[0] != -1) {
        auto now = Clock::now();

        if (has_deadline && !result.timed_out && now >= deadline) {
            spdlog::debug("Process {} exceeded {}ms, killing group", pid, options.timeout.count());
            kill(-pid, SIGKILL);
            result.timed_out = true;
            drain_deadline = now + kDrainGrace;
        }
        if (result.timed_out && now >= drain_deadline) {
            // A descendant escaped the group and still holds the pipes.
            break;
        }

        int wait_ms = -1;
        if (result.timed_out) {
            wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                drain_deadline - now).count());
        } else if (has_deadline) {
            wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - now).count()) + 1;
        }

        std::array<pollfd, 2> fds{{{pipes.out[0], POLLIN, 0}, {pipes.err[0], POLLIN, 0}}};
        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            kill(-pid, SIGKILL);
            throw std::runtime_error(ErrnoMessage("poll", errno));
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) {
                continue;
            }
            int& fd = (i == 0) ? pipes.out[0] : pipes.err[0];
            std::string& target = (i == 0) ? result.stdout_output : result.stderr_output;

            ssize_t count = read(fd, buffer.data(), buffer.size());
            if (count > 0) {
                AppendCapped(target, buffer.data(), static_cast<std::size_t>(count),
                             options.max_output_bytes, result.output_truncated);
            } else if (count == 0 || errno != EINTR) {
                CloseFd(fd);
            }
        }
    }

    // Pipes are closed; the child normally exits right away. Keep honouring
    // the deadline in case it closed its outputs and kept running.
    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited == -1 && errno != EINTR) {
            spdlog::warn("waitpid({}) failed: {}", pid, std::strerror(errno));
            status = 0;
            break;
        }
        if (has_deadline && !result.timed_out && Clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            result.timed_out = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    result.exit_code = DecodeStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return result;
}

} // namespace utils
} // namespace repobox
