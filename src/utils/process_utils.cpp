/**
 * @file process_utils.cpp
 * @brief Implementation of deadline-bounded child process execution
 *
 * **Execution Workflow**:
 * 1. Create CLOEXEC pipes for stdout, stderr, optional stdin and a status
 *    channel used to report chdir/exec failures from the child
 * 2. fork(); the child moves into its own process group, wires its standard
 *    streams and exec's argv[0] through PATH
 * 3. The parent polls stdout/stderr (and writes stdin) until both streams close
 *    or the deadline passes, reaping the child as soon as it exits
 * 4. On deadline the whole process group receives SIGKILL
 *
 * @date 2025
 */

#include "redeyes/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace redeyes {
namespace utils {

namespace {

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

// Written by the child to the status pipe when it cannot reach exec
struct SpawnFailure {
    int stage;
    int error;
};

std::once_flag g_sigpipe_once;

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void AppendLimited(std::string& dst, const char* src, std::size_t n,
                   std::size_t limit, bool& truncated) {
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min(n, avail);
    dst.append(src, take);
    if (take < n) {
        truncated = true;
    }
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Drain whatever is readable; closes the descriptor on EOF or hard error
void ReadAvailable(int& fd, std::string& dst, std::size_t limit, bool& truncated) {
    char buffer[4096];
    while (fd >= 0) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            AppendLimited(dst, buffer, static_cast<std::size_t>(n), limit, truncated);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        CloseFd(fd);
    }
}

int DecodeExitStatus(int status) {
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

ProcessResult ProcessUtils::RunProcess(const ProcessSpec& spec) {
    ProcessResult result;
    const auto start = std::chrono::steady_clock::now();

    if (spec.argv.empty() || spec.argv.front().empty()) {
        result.spawn_failed = true;
        result.exit_code = 127;
        result.error_message = "Empty command";
        return result;
    }

    if (spec.stdin_data) {
        std::call_once(g_sigpipe_once, []() { signal(SIGPIPE, SIG_IGN); });
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0 ||
        (spec.stdin_data && pipe2(in_pipe, O_CLOEXEC) != 0)) {
        result.spawn_failed = true;
        result.exit_code = 127;
        result.error_message = std::string("Pipe creation failed: ") + std::strerror(errno);
        close_all();
        return result;
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string working_directory = spec.working_directory.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.exit_code = 127;
        result.error_message = std::string("Fork failed: ") + std::strerror(errno);
        close_all();
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        if (in_pipe[0] >= 0) {
            dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        SpawnFailure failure{0, 0};
        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            failure = {kStageChdir, errno};
            ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        }

        execvp(argv[0], argv.data());
        failure = {kStageExec, errno};
        ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(in_pipe[0]);
    CloseFd(status_pipe[1]);

    // Blocks until exec succeeds (EOF via CLOEXEC) or the child reports failure
    SpawnFailure failure{0, 0};
    ssize_t status_bytes;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_all();

        result.spawn_failed = true;
        result.exit_code = 127;
        if (failure.stage == kStageChdir) {
            result.error_message = "Cannot enter working directory '" + working_directory +
                                   "': " + std::strerror(failure.error);
        } else {
            result.error_message = "Failed to execute '" + spec.argv.front() +
                                   "': " + std::strerror(failure.error);
        }
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    }

    SetNonBlocking(out_pipe[0]);
    SetNonBlocking(err_pipe[0]);
    if (in_pipe[1] >= 0) {
        SetNonBlocking(in_pipe[1]);
        if (spec.stdin_data->empty()) {
            CloseFd(in_pipe[1]);
        }
    }

    // Observe the leader's exit without reaping it. The unreaped zombie keeps
    // its pid, and with it the process group id, reserved until the final kill.
    auto leader_exited = [pid]() {
        siginfo_t info{};
        return waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
               info.si_pid == pid;
    };

    const auto deadline = start + spec.timeout;
    auto drain_deadline = deadline;
    bool child_exited = false;
    int status = 0;
    std::size_t stdin_written = 0;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (!child_exited && leader_exited()) {
            child_exited = true;
            // Background descendants may hold the pipes open after the leader exits
            drain_deadline = std::min(deadline, now + std::chrono::milliseconds(200));
        }
        if (child_exited && now >= drain_deadline) {
            break;
        }
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        int in_index = -1;
        if (out_pipe[0] >= 0) {
            out_index = static_cast<int>(count);
            fds[count++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_pipe[0] >= 0) {
            err_index = static_cast<int>(count);
            fds[count++] = {err_pipe[0], POLLIN, 0};
        }
        if (in_pipe[1] >= 0) {
            in_index = static_cast<int>(count);
            fds[count++] = {in_pipe[1], POLLOUT, 0};
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            (child_exited ? drain_deadline : deadline) - now);
        int wait_ms = static_cast<int>(std::max<long long>(
            1, std::min<long long>(remaining.count(), 50)));

        int rc = poll(fds, count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("poll failed for pid {}: {}", pid, std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        if (out_index >= 0 && fds[out_index].revents != 0) {
            ReadAvailable(out_pipe[0], result.stdout_output, spec.max_output_bytes,
                          result.stdout_truncated);
        }
        if (err_index >= 0 && fds[err_index].revents != 0) {
            ReadAvailable(err_pipe[0], result.stderr_output, spec.max_output_bytes,
                          result.stderr_truncated);
        }
        if (in_index >= 0 && fds[in_index].revents != 0) {
            if (fds[in_index].revents & (POLLERR | POLLHUP)) {
                CloseFd(in_pipe[1]);
            } else {
                const std::string& data = *spec.stdin_data;
                ssize_t n = write(in_pipe[1], data.data() + stdin_written,
                                  data.size() - stdin_written);
                if (n > 0) {
                    stdin_written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    CloseFd(in_pipe[1]);
                }
                if (stdin_written >= data.size()) {
                    CloseFd(in_pipe[1]);
                }
            }
        }
    }

    // Streams closed early; wait for the leader but never past the deadline
    while (!child_exited && !result.timed_out) {
        if (leader_exited()) {
            child_exited = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // Leftover group members never outlive the command. The leader is still
    // unreaped here, so the group id cannot belong to anyone else yet.
    kill(-pid, SIGKILL);
    if (!child_exited) {
        kill(pid, SIGKILL);
    }
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    close_all();

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.exit_code = result.timed_out ? 124 : DecodeExitStatus(status);

    return result;
}

// ============================================================================
// ARGV HELPERS
// ============================================================================

std::vector<std::string> ProcessUtils::ShellArgv(const std::string& command) {
    return {"/bin/sh", "-c", command};
}

std::string ProcessUtils::DescribeArgv(const std::vector<std::string>& argv) {
    std::string description;
    for (const auto& arg : argv) {
        if (!description.empty()) {
            description += ' ';
        }
        description += arg;
    }
    return description;
}

} // namespace utils
} // namespace redeyes
