/**
 * @file docker_sandbox.cpp
 * @brief Implementation of the Docker-backed sandbox provider
 *
 * **Security Hardening**:
 * - **Network Isolation**: --network none unless the session enables network
 * - **Capability Dropping**: --cap-drop ALL
 * - **No New Privileges**: --security-opt no-new-privileges
 * - **Resource Limits**: memory (swap pinned to memory), CPU, pid limits
 *
 * **Timeout Management**:
 * - In-container: coreutils `timeout` sends SIGTERM at the deadline and
 *   SIGKILL two seconds later, so the user's processes never outlive it
 * - Host-side: the docker client is killed `kill_grace` seconds after the
 *   deadline in case the daemon stops responding
 *
 * @date 2025
 */

#include "sandrun/core/docker_sandbox.hpp"

#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace sandrun {
namespace core {

namespace {

constexpr int kTimeoutExitStatus = 124;     // coreutils timeout, TERM delivered
constexpr int kKilledExitStatus = 137;      // 128 + SIGKILL
constexpr const char* kKillAfterSeconds = "2";
constexpr std::size_t kMaxDiagnosticLength = 4000;

std::string FirstLine(const std::string& text) {
    std::string trimmed = utils::StringUtils::Trim(text);
    auto pos = trimmed.find('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(0, pos);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerSandbox::DockerSandbox(DockerSandboxOptions options, DockerRunner runner)
    : options_(std::move(options))
    , runner_(std::move(runner)) {

    if (!runner_) {
        std::string binary = options_.docker_binary;
        runner_ = [binary](const std::vector<std::string>& args,
                           std::chrono::milliseconds timeout) {
            std::vector<std::string> argv;
            argv.reserve(args.size() + 1);
            argv.push_back(binary);
            argv.insert(argv.end(), args.begin(), args.end());
            return utils::RunProcess(argv, timeout);
        };
    }
}

DockerSandbox::~DockerSandbox() {
    Cleanup();
}

// ============================================================================
// ENVIRONMENT CREATION
// ============================================================================

void DockerSandbox::EnsureReady(const SandboxSettings& settings) {
    if (IsReady()) {
        spdlog::debug("Sandbox container {} already running", container_id_.substr(0, 12));
        return;
    }

    ValidateSettings(settings);

    std::string container_name = GenerateContainerName();
    spdlog::info("Creating sandbox container {} (image: {}, network: {})",
                 container_name, settings.image,
                 settings.network_enabled ? "enabled" : "disabled");

    utils::ProcessResult result;
    try {
        result = Docker(BuildRunArgs(settings, container_name), settings.timeout);
    }
    catch (const std::exception& e) {
        throw ProvisioningError("Failed to launch docker: " + std::string(e.what()));
    }

    if (!result.Succeeded()) {
        // A timed out `docker run` may still have created the container
        try {
            auto removed = Docker({"rm", "-f", container_name}, options_.control_timeout);
            if (!removed.Succeeded()) {
                spdlog::debug("No partial container {} to remove", container_name);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to remove partially created container {}: {}",
                         container_name, e.what());
        }

        std::string reason = result.timed_out
            ? "timed out after " + std::to_string(settings.timeout.count()) + "s"
            : utils::StringUtils::Trim(result.stderr_output);
        if (reason.empty()) {
            reason = "docker exited with status " + std::to_string(result.exit_code);
        }
        throw ProvisioningError("Failed to start sandbox container: " + reason);
    }

    container_id_ = FirstLine(result.stdout_output);
    if (container_id_.empty()) {
        container_id_ = container_name;
    }
    settings_ = settings;

    spdlog::info("✓ Sandbox container ready: {}", container_id_.substr(0, 12));
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

void DockerSandbox::WriteFile(const std::filesystem::path& relative_path,
                              const std::string& content) {
    if (!IsReady()) {
        throw ProviderUnavailableError("Sandbox is not running");
    }
    if (!IsSafeRelativePath(relative_path)) {
        throw FilesystemError("Invalid sandbox path: " + relative_path.string());
    }

    auto target = settings_.work_dir / relative_path;

    if (relative_path.has_parent_path()) {
        auto mkdir = Docker({"exec", container_id_, "mkdir", "-p",
                             target.parent_path().string()},
                            options_.control_timeout);
        if (!mkdir.Succeeded()) {
            throw FilesystemError("Failed to create directory " +
                                  target.parent_path().string() + ": " +
                                  utils::StringUtils::Trim(mkdir.stderr_output));
        }
    }

    auto host_file = std::filesystem::temp_directory_path() /
                     (GenerateContainerName() + "_" + relative_path.filename().string());
    {
        std::ofstream out(host_file, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw FilesystemError("Failed to create staging file: " + host_file.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw FilesystemError("Failed to write staging file: " + host_file.string());
        }
    }

    utils::ProcessResult result;
    try {
        result = Docker({"cp", host_file.string(), container_id_ + ":" + target.string()},
                        options_.control_timeout);
    }
    catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(host_file, ec);
        throw FilesystemError("Failed to copy file into sandbox: " + std::string(e.what()));
    }

    std::error_code ec;
    std::filesystem::remove(host_file, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", host_file.string(), ec.message());
    }

    if (!result.Succeeded()) {
        if (!IsContainerRunning()) {
            throw ProviderUnavailableError("Sandbox container " + container_id_.substr(0, 12) +
                                           " is no longer running");
        }
        throw FilesystemError("Failed to copy file into sandbox: " +
                              utils::StringUtils::Trim(result.stderr_output));
    }

    spdlog::debug("Wrote {} bytes to {}", content.size(), target.string());
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

std::string DockerSandbox::RunCommand(const std::string& command,
                                      std::chrono::seconds timeout) {
    if (!IsReady()) {
        throw ProviderUnavailableError("Sandbox is not running");
    }

    spdlog::debug("Running in sandbox (timeout {}s): {}", timeout.count(), command);

    utils::ProcessResult result;
    try {
        result = Docker(BuildExecArgs(command, timeout), timeout + options_.kill_grace);
    }
    catch (const std::exception& e) {
        throw ProviderUnavailableError("Failed to launch docker exec: " + std::string(e.what()));
    }

    // 124 and 137 are also ordinary exit statuses; only count them once the budget is spent
    bool budget_spent = result.duration >= timeout;
    bool expired_in_container = result.exit_code == kTimeoutExitStatus && budget_spent;
    bool killed_at_deadline = result.exit_code == kKilledExitStatus && budget_spent;
    if (result.timed_out || expired_in_container || killed_at_deadline) {
        throw TimeoutError("Command timed out after " + std::to_string(timeout.count()) + "s",
                           timeout);
    }

    if (result.exit_code != 0) {
        if (!IsContainerRunning()) {
            throw ProviderUnavailableError("Sandbox container " + container_id_.substr(0, 12) +
                                           " is no longer running");
        }

        std::string diagnostic = utils::StringUtils::Trim(
            result.stderr_output.empty() ? result.stdout_output : result.stderr_output);
        diagnostic = utils::StringUtils::Truncate(diagnostic, kMaxDiagnosticLength);

        std::string message = "Command exited with status " + std::to_string(result.exit_code);
        if (!diagnostic.empty()) {
            message += ": " + diagnostic;
        }
        throw CommandError(message, result.exit_code, diagnostic);
    }

    return result.stdout_output;
}

// ============================================================================
// CLEANUP
// ============================================================================

void DockerSandbox::Cleanup() noexcept {
    if (container_id_.empty()) {
        return;
    }

    spdlog::info("Removing sandbox container {}", container_id_.substr(0, 12));

    try {
        auto result = Docker({"rm", "-f", container_id_}, options_.control_timeout);
        if (!result.Succeeded()) {
            spdlog::warn("Failed to remove container {}: {}", container_id_,
                         utils::StringUtils::Trim(result.stderr_output));
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to remove container {}: {}", container_id_, e.what());
    }

    container_id_.clear();
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerSandbox::CheckDocker(const std::string& docker_binary) {
    try {
        auto version = utils::RunProcess({docker_binary, "--version"}, std::chrono::seconds(10));
        if (!version.Succeeded()) {
            spdlog::error("Docker is not installed. Please install Docker first.");
            return false;
        }
        spdlog::info("Docker version: {}", utils::StringUtils::Trim(version.stdout_output));

        auto info = utils::RunProcess({docker_binary, "info"}, std::chrono::seconds(30));
        if (!info.Succeeded()) {
            spdlog::error("Docker is not running. Please start Docker and try again.");
            return false;
        }
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Docker check failed: {}", e.what());
        return false;
    }
}

bool DockerSandbox::IsContainerRunning() const {
    if (container_id_.empty()) {
        return false;
    }

    try {
        auto result = Docker({"inspect", "--format", "{{json .State}}", container_id_},
                             options_.control_timeout);
        if (!result.Succeeded()) {
            return false;
        }
        json state = json::parse(result.stdout_output);
        return state.value("Running", false);
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to inspect container {}: {}", container_id_, e.what());
        return false;
    }
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerSandbox::BuildRunArgs(const SandboxSettings& settings,
                                                     const std::string& container_name) const {
    std::vector<std::string> args = {"run", "-d", "--name", container_name};

    args.push_back("--hostname");
    args.push_back("sandbox");

    args.push_back("--network");
    args.push_back(settings.network_enabled ? "bridge" : "none");

    if (!settings.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(settings.memory_limit);
        args.push_back("--memory-swap");
        args.push_back(settings.memory_limit);
    }

    std::ostringstream cpus;
    cpus << std::fixed << std::setprecision(2) << settings.cpu_limit;
    args.push_back("--cpus");
    args.push_back(cpus.str());

    if (settings.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(settings.pids_limit));
    }

    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    args.push_back("-w");
    args.push_back(settings.work_dir.string());

    args.push_back(settings.image);
    args.push_back("sleep");
    args.push_back("infinity");

    return args;
}

std::vector<std::string> DockerSandbox::BuildExecArgs(const std::string& command,
                                                      std::chrono::seconds timeout) const {
    return {
        "exec",
        "-w", settings_.work_dir.string(),
        container_id_,
        "timeout", "-k", kKillAfterSeconds, std::to_string(timeout.count()),
        "sh", "-c", command
    };
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

utils::ProcessResult DockerSandbox::Docker(const std::vector<std::string>& args,
                                           std::chrono::milliseconds timeout) const {
    return runner_(args, timeout);
}

void DockerSandbox::ValidateSettings(const SandboxSettings& settings) const {
    if (settings.image.empty()) {
        throw ProvisioningError("Sandbox image is required");
    }
    if (!settings.work_dir.is_absolute()) {
        throw ProvisioningError("Sandbox work_dir must be absolute: " + settings.work_dir.string());
    }
    if (settings.cpu_limit <= 0.0) {
        throw ProvisioningError("Invalid cpu_limit: must be > 0");
    }
    if (settings.timeout.count() <= 0) {
        throw ProvisioningError("Invalid timeout: must be > 0");
    }
}

std::string DockerSandbox::GenerateContainerName() const {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(1000, 9999);

    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    return options_.container_prefix + "_" + std::to_string(timestamp) + "_" +
           std::to_string(dis(gen));
}

bool DockerSandbox::IsSafeRelativePath(const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute() || !path.has_filename()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace sandrun
