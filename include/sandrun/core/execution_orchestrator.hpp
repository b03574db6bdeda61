/**
 * @file execution_orchestrator.hpp
 * @brief Drives one sandbox through the code execution lifecycle
 *
 * Turns an ExecutionRequest into the fixed sequence
 * readiness -> dependency install -> write artifact -> bounded run ->
 * classify -> optional teardown, and always answers with a well-formed
 * ExecutionResult.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_result.hpp"
#include "sandrun/core/package_tracker.hpp"
#include "sandrun/core/sandbox_provider.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandrun {
namespace core {

/**
 * @brief Creates a fresh, not yet started provider for a new session
 */
using SandboxProviderFactory = std::function<std::unique_ptr<SandboxProvider>()>;

/**
 * @struct OrchestratorConfig
 * @brief Session defaults and execution settings
 */
struct OrchestratorConfig {
    SandboxSettings sandbox;                              ///< Defaults for new environments
    std::chrono::seconds install_timeout{120};            ///< Budget of one pip install batch
    std::string script_filename{"execution_script.py"};   ///< Artifact path (relative to work dir)
    std::string interpreter{"python"};                    ///< Command that runs the artifact
    bool recreate_on_network_change{false};               ///< Rebuild session on posture change
    std::string environment_label{"Docker sandbox (Python)"};  ///< Shown in result messages
};

/**
 * @class ExecutionOrchestrator
 * @brief Session owner and execution state machine
 *
 * Owns at most one session: a provider together with the record of packages
 * installed into it. The session is created by the first request and lives
 * until Reset() (or an auto-terminating request) destroys both at once.
 *
 * **Network posture**: the first request of a session decides whether the
 * environment has network access. Later requests asking for a different
 * posture reuse the existing environment unless recreate_on_network_change
 * is enabled, in which case the session is rebuilt.
 *
 * **Thread Safety**: Thread-safe. Requests are serialized; each Execute()
 * holds the session lock from readiness to teardown.
 *
 * **Usage Example**:
 * @code
 * OrchestratorConfig config;
 * ExecutionOrchestrator orchestrator(
 *     [] { return std::make_unique<DockerSandbox>(); }, config);
 *
 * ExecutionRequest request;
 * request.code = "import numpy; print(numpy.arange(3))";
 * request.packages = {"numpy"};
 * request.timeout_seconds = 30;
 *
 * auto result = orchestrator.Execute(request);
 * std::cout << result.human_message << std::endl;
 *
 * orchestrator.Reset();
 * @endcode
 */
class ExecutionOrchestrator {
public:
    /**
     * @brief Construct orchestrator
     * @param factory Provider factory used whenever a session starts
     * @param config Session defaults and execution settings
     */
    explicit ExecutionOrchestrator(SandboxProviderFactory factory,
                                   OrchestratorConfig config = OrchestratorConfig{});

    /// Tears down any live session
    ~ExecutionOrchestrator();

    ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
    ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

    /**
     * @brief Execute one request
     *
     * Never throws: every fault is converted into a failure result with a
     * non-empty message. If request.auto_terminate is set the session is torn
     * down before returning, whatever the outcome.
     *
     * @param request Execution request
     * @return Fully populated result
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /**
     * @brief Execute one request on a background thread
     *
     * Same semantics and serialization as Execute().
     *
     * @param request Execution request (copied)
     * @return Future resolving to the result
     */
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request);

    /**
     * @brief End the current session
     *
     * Cleans up the provider, then drops it together with the installed
     * package record. No-op when no session exists.
     */
    void Reset();

    /// Whether a session (live environment) exists
    bool HasEnvironment() const;

    /// Network posture of the live environment, nullopt without a session
    std::optional<bool> NetworkEnabled() const;

    /// Packages installed in the live environment (sorted)
    std::vector<std::string> InstalledPackages() const;

private:
    struct Session {
        std::unique_ptr<SandboxProvider> provider;
        PackageTracker packages;
        bool network_enabled{false};
    };

    SandboxProviderFactory factory_;
    OrchestratorConfig config_;
    std::unique_ptr<Session> session_;
    mutable std::mutex mutex_;

    ExecutionResult Run(const ExecutionRequest& request);
    Session& EnsureSession(bool allow_network);
    void ResetLocked() noexcept;

    std::optional<InvalidRequest> Validate(const ExecutionRequest& request) const;
    std::string BuildInstallCommand(const std::vector<std::string>& packages) const;
    std::string BuildRunCommand() const;

    ExecutionResult Succeed(const ExecutionRequest& request, std::string output,
                            bool network_enabled) const;
    ExecutionResult Fail(const ExecutionRequest& request, const FailureCause& cause,
                         std::optional<bool> network_enabled) const;
    std::string ComposeFailureMessage(const FailureCause& cause) const;
};

} // namespace core
} // namespace sandrun
