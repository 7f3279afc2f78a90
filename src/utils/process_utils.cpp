/**
 * @file process_utils.cpp
 * @brief Implementation of host process execution
 *
 * **Execution Model**:
 * ```
 * parent ── pipe(stdout) ──┐
 *        ── pipe(stderr) ──┤ fork
 *                          └─ child: setpgid, dup2, execvp
 * parent: poll both pipes until EOF or deadline → waitpid
 * ```
 *
 * Both pipes are drained concurrently with poll() so a child that fills one
 * pipe while the parent blocks on the other cannot deadlock.
 *
 * @date 2025
 */

#include "codecell/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codecell {
namespace utils {

namespace {

// Deadlines further out than this are treated as this far out, so the
// steady_clock arithmetic cannot overflow
constexpr std::chrono::milliseconds kLongestDeadline = std::chrono::hours(24 * 365);

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void KillGroup(pid_t pid) {
    // Negative pid targets the process group created in the child
    if (kill(-pid, SIGKILL) == -1) {
        kill(pid, SIGKILL);
    }
}

int DecodeWaitStatus(int status) {
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

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::optional<std::chrono::milliseconds> timeout) {
    using Clock = std::chrono::steady_clock;

    ProcessResult result;
    if (argv.empty()) {
        result.error = "Empty command";
        return result;
    }

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    // Build the argument vector before fork so the child does not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        result.error = std::string("Failed to create pipe: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        result.error = std::string("Failed to create pipe: ") + std::strerror(errno);
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        return result;
    }

    auto start_time = Clock::now();
    pid_t pid = fork();
    if (pid == -1) {
        result.error = std::string("Failed to fork process: ") + std::strerror(errno);
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        CloseFd(stderr_pipe[0]);
        CloseFd(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    result.launched = true;
    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);

    std::optional<Clock::time_point> deadline;
    if (timeout) {
        deadline = start_time + std::min(*timeout, kLongestDeadline);
    }

    std::array<pollfd, 2> fds{};
    fds[0] = {stdout_pipe[0], POLLIN, 0};
    fds[1] = {stderr_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
    int open_fds = 2;
    std::array<char, 4096> buffer{};

    while (open_fds > 0) {
        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Clock::now()).count();
            if (remaining <= 0) {
                KillGroup(pid);
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining, std::numeric_limits<int>::max()));
        }

        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll failed: ") + std::strerror(errno);
            KillGroup(pid);
            break;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }

            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    CloseFd(stdout_pipe[0]);
    CloseFd(stderr_pipe[0]);

    // The child may outlive its pipes; keep honouring the deadline while reaping
    int status = 0;
    while (true) {
        bool poll_only = deadline.has_value() && !result.timed_out;
        pid_t waited = waitpid(pid, &status, poll_only ? WNOHANG : 0);
        if (waited == pid) {
            break;
        }
        if (waited == -1) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }
        if (Clock::now() >= *deadline) {
            KillGroup(pid);
            result.timed_out = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result.error.empty()) {
        result.exit_code = DecodeWaitStatus(status);
    }
    if (result.exit_code == 127 && !result.timed_out && result.stdout_output.empty()
        && result.stderr_output.empty()) {
        result.error = "Failed to execute " + argv[0];
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start_time);

    if (result.timed_out) {
        spdlog::warn("Command timed out after {} ms: {}", result.duration.count(), argv[0]);
    }

    return result;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::ostringstream cmd;
    bool first = true;

    for (const auto& arg : argv) {
        if (!first) {
            cmd << ' ';
        }
        first = false;

        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            cmd << '"' << arg << '"';
        } else {
            cmd << arg;
        }
    }

    return cmd.str();
}

} // namespace utils
} // namespace codecell
