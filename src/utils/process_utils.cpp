/**
 * @file process_utils.cpp
 * @brief fork/exec subprocess runner with deadline enforcement
 *
 * **Execution Workflow**:
 * 1. Create stdout/stderr pipes (close-on-exec)
 * 2. fork(); child joins a fresh process group, redirects stdio, execvp()
 * 3. Parent polls both pipes until EOF or deadline
 * 4. On deadline: SIGKILL to the process group
 * 5. Reap the child and decode its wait status
 *
 * @date 2025
 */

#include "sandrun/utils/process_utils.hpp"

#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandrun {
namespace utils {

namespace {

constexpr int kExecFailedStatus = 127;
constexpr int kPollSliceMs = 100;

void CloseFd(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

// Returns false once the descriptor reached EOF (and was closed).
bool DrainFd(int& fd, std::string& sink) {
    std::array<char, 4096> buffer;
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        sink.append(buffer.data(), static_cast<std::size_t>(n));
        return true;
    }
    if (n == -1 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    CloseFd(fd);
    return false;
}

// Runs between fork and exec, so it must not allocate; args is prepared by the parent
[[noreturn]] void ExecChild(char* const* args, int stdout_fd, int stderr_fd) {
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull != -1) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    dup2(stdout_fd, STDOUT_FILENO);
    dup2(stderr_fd, STDERR_FILENO);

    execvp(args[0], args);

    // Only async-signal-safe calls from here on
    const char* reason = strerror(errno);
    const char prefix[] = "exec failed: ";
    ssize_t ignored = write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    ignored = write(STDERR_FILENO, reason, strlen(reason));
    ignored = write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    _exit(kExecFailedStatus);
}

void DecodeWaitStatus(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
}

} // anonymous namespace

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argv");
    }

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        throw std::system_error(err, std::generic_category(), "pipe2");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        CloseFd(stderr_pipe[0]);
        CloseFd(stderr_pipe[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (pid == 0) {
        ExecChild(args.data(), stdout_pipe[1], stderr_pipe[1]);
    }

    // Both sides race to set the group so kill(-pid) works immediately
    setpgid(pid, pid);
    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);

    ProcessResult result;
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    const bool has_deadline = timeout.count() > 0;
    const auto deadline = start + timeout;

    auto past_deadline = [&]() {
        return has_deadline && std::chrono::steady_clock::now() >= deadline;
    };

    while ((out_fd != -1 || err_fd != -1) && !past_deadline()) {
        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        if (out_fd != -1) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd != -1) fds[nfds++] = {err_fd, POLLIN, 0};

        int ret = poll(fds.data(), nfds, kPollSliceMs);
        if (ret == -1) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed: {}", strerror(errno));
            break;
        }
        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_fd) {
                DrainFd(out_fd, result.stdout_output);
            } else if (fds[i].fd == err_fd) {
                DrainFd(err_fd, result.stderr_output);
            }
        }
    }

    int status = 0;
    bool reaped = false;
    while (!reaped && !past_deadline()) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            reaped = true;
        } else if (ret == -1 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (!reaped) {
        spdlog::warn("Deadline of {} ms reached, killing pid {}", timeout.count(), pid);
        result.timed_out = true;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
    }

    CloseFd(out_fd);
    CloseFd(err_fd);

    DecodeWaitStatus(status, result);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("Process {} finished: exit={} signal={} timed_out={} ({} ms)",
                  pid, result.exit_code, result.signal, result.timed_out,
                  result.duration.count());

    return result;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        bool plain = !arg.empty() &&
                     arg.find_first_of(" \t\n'\"\\$`;&|<>()*?") == std::string::npos;
        quoted.push_back(plain ? arg : StringUtils::ShellQuote(arg));
    }
    return StringUtils::Join(quoted, " ");
}

} // namespace utils
} // namespace sandrun
