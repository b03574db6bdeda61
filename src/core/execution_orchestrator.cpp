/**
 * @file execution_orchestrator.cpp
 * @brief Implementation of the execution lifecycle
 *
 * @date 2025
 */

#include "sandrun/core/execution_orchestrator.hpp"
#include "sandrun/utils/scope_exit.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <type_traits>

namespace sandrun {
namespace core {

namespace {

const char* const kTerminateHint = "Please use the terminate tool to end the session.";

const char* const kContinueHint =
    "Task completed. To execute other code, please send a new request; "
    "if no further tasks, use the terminate tool to end the session.";

const char* PostureName(bool network_enabled) {
    return network_enabled ? "Enabled" : "Disabled";
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ExecutionOrchestrator::ExecutionOrchestrator(SandboxProviderFactory factory,
                                             OrchestratorConfig config)
    : factory_(std::move(factory))
    , config_(std::move(config)) {

    if (!factory_) {
        throw std::invalid_argument("ExecutionOrchestrator requires a sandbox provider factory");
    }

    spdlog::debug("Execution orchestrator created (image: {}, install timeout: {}s)",
                 config_.sandbox.image, config_.install_timeout.count());
}

ExecutionOrchestrator::~ExecutionOrchestrator() {
    Reset();
}

// ============================================================================
// PUBLIC API
// ============================================================================

ExecutionResult ExecutionOrchestrator::Execute(const ExecutionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto start = std::chrono::steady_clock::now();
    ExecutionResult result;

    {
        utils::ScopeExit teardown([this, &request] {
            if (request.auto_terminate) {
                spdlog::info("Auto-terminate requested, tearing down sandbox");
                ResetLocked();
            }
        });

        try {
            result = Run(request);
        } catch (const std::exception& e) {
            spdlog::error("Unexpected failure while executing request: {}", e.what());
            result = Fail(request, ExecutionFault{e.what()},
                          session_ ? std::optional<bool>(session_->network_enabled) : std::nullopt);
        } catch (...) {
            spdlog::error("Unexpected non-standard failure while executing request");
            result = Fail(request, ExecutionFault{"unknown error"},
                          session_ ? std::optional<bool>(session_->network_enabled) : std::nullopt);
        }
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.succeeded) {
        spdlog::info("Execution completed in {}ms", result.duration.count());
    } else {
        spdlog::warn("Execution failed ({}) after {}ms",
                     ErrorKindToString(*result.error_kind), result.duration.count());
    }

    return result;
}

std::future<ExecutionResult> ExecutionOrchestrator::ExecuteAsync(ExecutionRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Execute(request);
    });
}

void ExecutionOrchestrator::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ResetLocked();
}

bool ExecutionOrchestrator::HasEnvironment() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

std::optional<bool> ExecutionOrchestrator::NetworkEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->network_enabled;
}

std::vector<std::string> ExecutionOrchestrator::InstalledPackages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return {};
    }
    return session_->packages.Installed();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

ExecutionResult ExecutionOrchestrator::Run(const ExecutionRequest& request) {
    if (auto invalid = Validate(request)) {
        spdlog::warn("Rejecting request: {}", invalid->diagnostic);
        return Fail(request, *invalid, std::nullopt);
    }

    const auto packages = utils::StringUtils::NormalizePackages(request.packages);

    // Step 1: readiness
    Session* session = nullptr;
    try {
        session = &EnsureSession(request.allow_network);
    } catch (const std::exception& e) {
        spdlog::error("Failed to provision sandbox: {}", e.what());
        return Fail(request, ProvisioningFailure{e.what()}, std::nullopt);
    }

    const bool network = session->network_enabled;

    // Step 2: dependencies, one batch for everything not yet installed
    auto pending = session->packages.Pending(packages);
    if (!pending.empty()) {
        spdlog::info("Installing packages: {}", utils::StringUtils::Join(pending, ", "));
        try {
            auto output = session->provider->RunCommand(BuildInstallCommand(pending),
                                                        config_.install_timeout);
            spdlog::debug("pip output: {}", utils::StringUtils::Truncate(output, 2000));
        } catch (const ProviderUnavailableError& e) {
            spdlog::error("Sandbox unavailable during package installation: {}", e.what());
            return Fail(request, ProvisioningFailure{e.what()}, network);
        } catch (const CommandError& e) {
            spdlog::error("Package installation failed: {}", e.what());
            return Fail(request,
                        DependencyInstallFailure{
                            pending, e.Diagnostic().empty() ? std::string(e.what()) : e.Diagnostic()},
                        network);
        } catch (const std::exception& e) {
            spdlog::error("Package installation failed: {}", e.what());
            return Fail(request, DependencyInstallFailure{pending, e.what()}, network);
        }
        session->packages.MarkInstalled(pending);
    } else if (!packages.empty()) {
        spdlog::debug("All requested packages already installed");
    }

    // Step 3: artifact
    try {
        session->provider->WriteFile(config_.script_filename, request.code);
    } catch (const std::exception& e) {
        spdlog::error("Failed to write {}: {}", config_.script_filename, e.what());
        return Fail(request, ProvisioningFailure{e.what()}, network);
    }

    // Step 4: bounded run
    spdlog::info("Executing code in sandbox (timeout: {}s, network: {})",
                 request.timeout_seconds, PostureName(network));

    ExecutionResult result;
    try {
        auto output = session->provider->RunCommand(BuildRunCommand(),
                                                    std::chrono::seconds(request.timeout_seconds));
        result = Succeed(request, std::move(output), network);
    } catch (const TimeoutError& e) {
        result = Fail(request, ExecutionTimeout{request.timeout_seconds, e.what()}, network);
    } catch (const ProviderUnavailableError& e) {
        spdlog::error("Sandbox unavailable during execution: {}", e.what());
        result = Fail(request, ProvisioningFailure{e.what()}, network);
    } catch (const CommandError& e) {
        result = Fail(request,
                      ExecutionFault{e.Diagnostic().empty() ? std::string(e.what()) : e.Diagnostic()},
                      network);
    } catch (const std::exception& e) {
        result = Fail(request, ExecutionFault{e.what()}, network);
    }

    result.installed_packages = std::move(pending);
    return result;
}

ExecutionOrchestrator::Session& ExecutionOrchestrator::EnsureSession(bool allow_network) {
    if (session_ && session_->network_enabled != allow_network) {
        if (config_.recreate_on_network_change) {
            spdlog::info("Network posture change requested ({} -> {}), recreating sandbox",
                         PostureName(session_->network_enabled), PostureName(allow_network));
            ResetLocked();
        } else {
            spdlog::warn("Request asks for network {} but the sandbox was created with network {}; "
                         "reusing existing sandbox",
                         PostureName(allow_network), PostureName(session_->network_enabled));
        }
    }

    if (session_) {
        return *session_;
    }

    spdlog::info("Initializing sandbox for code execution");

    auto provider = factory_();
    if (!provider) {
        throw ProvisioningError("Sandbox provider factory returned no provider");
    }

    SandboxSettings settings = config_.sandbox;
    settings.network_enabled = allow_network;

    try {
        provider->EnsureReady(settings);
    } catch (...) {
        provider->Cleanup();
        throw;
    }

    auto session = std::make_unique<Session>();
    session->provider = std::move(provider);
    session->network_enabled = allow_network;
    session_ = std::move(session);

    spdlog::info("Sandbox ready (network: {})", PostureName(allow_network));
    return *session_;
}

void ExecutionOrchestrator::ResetLocked() noexcept {
    if (!session_) {
        return;
    }

    spdlog::info("Cleaning up sandbox environment");
    session_->provider->Cleanup();
    session_.reset();
    spdlog::info("Sandbox has been reset");
}

// ============================================================================
// HELPERS
// ============================================================================

std::optional<InvalidRequest> ExecutionOrchestrator::Validate(const ExecutionRequest& request) const {
    if (request.timeout_seconds <= 0) {
        return InvalidRequest{"timeout must be greater than 0 seconds, got " +
                              std::to_string(request.timeout_seconds)};
    }
    if (utils::StringUtils::Trim(request.code).empty()) {
        return InvalidRequest{"code must not be empty"};
    }
    return std::nullopt;
}

std::string ExecutionOrchestrator::BuildInstallCommand(const std::vector<std::string>& packages) const {
    std::string command = "pip install";
    for (const auto& package : packages) {
        command += " " + utils::StringUtils::ShellQuote(package);
    }
    command += " --no-cache-dir";
    return command;
}

std::string ExecutionOrchestrator::BuildRunCommand() const {
    return config_.interpreter + " " + utils::StringUtils::ShellQuote(config_.script_filename);
}

ExecutionResult ExecutionOrchestrator::Succeed(const ExecutionRequest& request,
                                               std::string output,
                                               bool network_enabled) const {
    ExecutionResult result;
    result.succeeded = true;
    result.timeout_seconds = request.timeout_seconds;
    result.network_enabled = network_enabled;

    result.human_message =
        "Code execution completed successfully! Output:\n\n" + output + "\n\n" +
        "Execution environment: " + config_.environment_label + "\n" +
        "Timeout setting: " + std::to_string(request.timeout_seconds) + " seconds\n" +
        "Network access: " + PostureName(network_enabled) + "\n" +
        "\n" + kContinueHint;

    result.raw_output = std::move(output);
    return result;
}

ExecutionResult ExecutionOrchestrator::Fail(const ExecutionRequest& request,
                                            const FailureCause& cause,
                                            std::optional<bool> network_enabled) const {
    ExecutionResult result;
    result.succeeded = false;
    result.error_kind = KindOf(cause);
    result.error_detail = DiagnosticOf(cause);
    result.human_message = ComposeFailureMessage(cause);
    result.timeout_seconds = request.timeout_seconds;
    result.network_enabled = network_enabled;
    return result;
}

std::string ExecutionOrchestrator::ComposeFailureMessage(const FailureCause& cause) const {
    std::string body = std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, DependencyInstallFailure>) {
            return "Error installing packages (" + utils::StringUtils::Join(c.packages, ", ") +
                   "): " + c.diagnostic +
                   "\nExecution terminated. Please check package names or try increasing timeout.";
        } else if constexpr (std::is_same_v<T, ExecutionTimeout>) {
            return "Execution timed out after " + std::to_string(c.timeout_seconds) +
                   " seconds. The code might be too complex, contain infinite loops, or require "
                   "more time to complete. Please modify the code or increase the timeout.";
        } else if constexpr (std::is_same_v<T, ExecutionFault>) {
            return "Error executing code: " + c.diagnostic;
        } else if constexpr (std::is_same_v<T, ProvisioningFailure>) {
            return "Sandbox environment unavailable: " + c.diagnostic +
                   "\nThe execution environment could not be created or reached.";
        } else {
            return "Invalid execution request: " + c.diagnostic;
        }
    }, cause);

    return body + "\n" + kTerminateHint;
}

} // namespace core
} // namespace sandrun
