/**
 * @file process_utils.hpp
 * @brief Host subprocess execution with a hard wall-clock deadline
 *
 * Runs an external program (typically the `docker` CLI) without a shell,
 * captures standard output and standard error separately and kills the whole
 * process group once the deadline passes. The call always returns within a
 * short, bounded time after the deadline.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sandrun {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a finished (or killed) subprocess
 */
struct ProcessResult {
    int exit_code{0};                       ///< Exit status (128 + signal if killed by a signal)
    int signal{0};                          ///< Terminating signal, 0 if exited normally
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool timed_out{false};                  ///< Killed because the deadline passed
    std::chrono::milliseconds duration{0};  ///< Wall time from spawn to reap

    bool Succeeded() const { return exit_code == 0 && !timed_out; }
};

/**
 * @brief Run a program and wait for it with a deadline
 *
 * The program is looked up in PATH (`execvp`). Standard input is
 * `/dev/null`. The child is placed in its own process group and the whole
 * group receives SIGKILL when the deadline passes.
 *
 * A program that cannot be executed exits with status 127 and a diagnostic
 * on its standard error, like a shell would report it.
 *
 * @param argv Program name followed by its arguments (must not be empty)
 * @param timeout Wall-clock budget; zero disables the deadline
 * @return ProcessResult with captured output and exit information
 *
 * @throws std::invalid_argument if argv is empty
 * @throws std::system_error if pipes cannot be created or fork() fails
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout);

/**
 * @brief Render argv as a single printable command line (for logs)
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace sandrun
