/**
 * @file sandbox_provider.hpp
 * @brief Isolated execution environment capability consumed by the orchestrator
 *
 * Declares the sandbox settings applied at environment creation, the typed
 * errors a provider reports, and the abstract SandboxProvider interface.
 * The orchestrator classifies failures by error type only; providers must
 * never rely on callers inspecting message text.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace sandrun {
namespace core {

/**
 * @struct SandboxSettings
 * @brief Limits and image applied when an environment is created
 *
 * Limits are fixed for the lifetime of an environment; changing them requires
 * destroying and recreating it.
 */
struct SandboxSettings {
    std::string image{"python:3.12-slim"};       ///< Container image
    std::filesystem::path work_dir{"/workspace"}; ///< Working directory inside the sandbox
    std::string memory_limit{"512m"};            ///< Memory limit (docker syntax)
    double cpu_limit{1.0};                       ///< CPU quota in cores
    int pids_limit{100};                         ///< Maximum process count
    std::chrono::seconds timeout{300};           ///< Budget of environment creation (may pull the image)
    bool network_enabled{false};                 ///< Network access (bridge) or none
};

/**
 * @class SandboxError
 * @brief Base class of all provider failures
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Isolation mechanism could not be started
class ProvisioningError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// File could not be written (environment unreachable or invalid path)
class FilesystemError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Command exceeded its time budget and was terminated
class TimeoutError : public SandboxError {
public:
    TimeoutError(const std::string& message, std::chrono::seconds budget)
        : SandboxError(message), budget_(budget) {}

    std::chrono::seconds Budget() const { return budget_; }

private:
    std::chrono::seconds budget_;
};

/// Command exited with a non-zero status
class CommandError : public SandboxError {
public:
    CommandError(const std::string& message, int exit_code, std::string diagnostic)
        : SandboxError(message), exit_code_(exit_code), diagnostic_(std::move(diagnostic)) {}

    int ExitCode() const { return exit_code_; }

    /// Diagnostic text produced by the command (stderr, or stdout if empty)
    const std::string& Diagnostic() const { return diagnostic_; }

private:
    int exit_code_;
    std::string diagnostic_;
};

/// Environment died or was never started
class ProviderUnavailableError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class SandboxProvider
 * @brief One isolated execution environment
 *
 * A provider instance represents a single environment. The orchestrator
 * creates one lazily, owns it exclusively and destroys it on reset.
 *
 * **Thread Safety**: NOT thread-safe. The orchestrator serializes access.
 */
class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    /**
     * @brief Start the environment if it is not running yet
     *
     * Idempotent: once ready, further calls do nothing and the original
     * settings stay in effect.
     *
     * @param settings Limits, image and network posture
     * @throws ProvisioningError if the isolation mechanism cannot be started
     */
    virtual void EnsureReady(const SandboxSettings& settings) = 0;

    /**
     * @brief Write (overwrite) a file inside the environment
     *
     * @param relative_path Path relative to the environment work directory
     * @param content Exact file content
     * @throws FilesystemError if the path is invalid or the write fails
     * @throws ProviderUnavailableError if the environment is not running
     */
    virtual void WriteFile(const std::filesystem::path& relative_path,
                           const std::string& content) = 0;

    /**
     * @brief Run a shell command inside the environment
     *
     * Must return (or throw) within a bounded grace period after the
     * deadline; the command's processes are terminated on timeout.
     *
     * @param command Command line interpreted by `sh -c`
     * @param timeout Wall-clock budget
     * @return Captured standard output
     * @throws TimeoutError if the budget is exceeded
     * @throws CommandError on non-zero exit
     * @throws ProviderUnavailableError if the environment died
     */
    virtual std::string RunCommand(const std::string& command,
                                   std::chrono::seconds timeout) = 0;

    /**
     * @brief Destroy the environment
     *
     * Idempotent and non-throwing; safe on an environment that was never
     * started or is already gone.
     */
    virtual void Cleanup() noexcept = 0;
};

} // namespace core
} // namespace sandrun
