/**
 * @file docker_sandbox.hpp
 * @brief Docker-backed sandbox provider
 *
 * Keeps one long-lived container per provider instance (`sleep infinity` as
 * the container's main process) and runs every command through
 * `docker exec`. Network posture and resource limits are fixed when the
 * container is created.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/sandbox_provider.hpp"
#include "sandrun/utils/process_utils.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sandrun {
namespace core {

/**
 * @brief Runs `docker <args...>` with a deadline
 *
 * Injected into DockerSandbox so command construction can be tested without
 * a Docker daemon. The default runner spawns the docker CLI through
 * utils::RunProcess().
 */
using DockerRunner = std::function<utils::ProcessResult(
    const std::vector<std::string>& args, std::chrono::milliseconds timeout)>;

/**
 * @struct DockerSandboxOptions
 * @brief Host-side knobs of the Docker provider
 */
struct DockerSandboxOptions {
    std::string docker_binary{"docker"};              ///< Docker CLI executable
    std::string container_prefix{"sandrun"};          ///< Container name prefix
    std::chrono::seconds control_timeout{60};         ///< Budget of cp/rm/inspect calls
    std::chrono::seconds kill_grace{5};               ///< Host-side slack after a command deadline
};

/**
 * @class DockerSandbox
 * @brief SandboxProvider implementation on top of the docker CLI
 *
 * **Lifecycle**:
 * ```
 * EnsureReady  -> docker run -d ... <image> sleep infinity
 * WriteFile    -> docker cp <host tmp> <id>:<work_dir>/<path>
 * RunCommand   -> docker exec -w <work_dir> <id> timeout -k 2 <N> sh -c <cmd>
 * Cleanup      -> docker rm -f <id>
 * ```
 *
 * **Hardening**: all capabilities dropped, no-new-privileges, memory/swap,
 * CPU and pid limits, `--network none` unless network is enabled.
 *
 * **Thread Safety**: NOT thread-safe.
 */
class DockerSandbox : public SandboxProvider {
public:
    /**
     * @brief Construct provider
     * @param options Host-side options
     * @param runner Docker command runner (nullptr = spawn the docker CLI)
     */
    explicit DockerSandbox(DockerSandboxOptions options = DockerSandboxOptions{},
                           DockerRunner runner = nullptr);

    /// Removes the container if it is still present
    ~DockerSandbox() override;

    DockerSandbox(const DockerSandbox&) = delete;
    DockerSandbox& operator=(const DockerSandbox&) = delete;

    void EnsureReady(const SandboxSettings& settings) override;
    void WriteFile(const std::filesystem::path& relative_path,
                   const std::string& content) override;
    std::string RunCommand(const std::string& command,
                           std::chrono::seconds timeout) override;
    void Cleanup() noexcept override;

    /**
     * @brief Check that the docker CLI and daemon are usable
     *
     * Runs `docker --version` and `docker info`.
     *
     * @param docker_binary Docker CLI executable
     * @return true if both commands succeed
     */
    static bool CheckDocker(const std::string& docker_binary = "docker");

    /// Whether a container has been started and not cleaned up
    bool IsReady() const { return !container_id_.empty(); }

    /// ID (or name) of the running container, empty if not ready
    const std::string& ContainerId() const { return container_id_; }

    /// Settings the current container was created with
    const SandboxSettings& Settings() const { return settings_; }

    /**
     * @brief Query the daemon for the container's running state
     * @return true if the container exists and is running
     */
    bool IsContainerRunning() const;

    /**
     * @brief Build the `docker run` arguments for a new container
     * @param settings Sandbox settings
     * @param container_name Name to assign
     * @return Arguments following the docker binary
     */
    std::vector<std::string> BuildRunArgs(const SandboxSettings& settings,
                                          const std::string& container_name) const;

    /**
     * @brief Build the `docker exec` arguments for a command
     * @param command Shell command
     * @param timeout In-container budget
     * @return Arguments following the docker binary
     */
    std::vector<std::string> BuildExecArgs(const std::string& command,
                                           std::chrono::seconds timeout) const;

private:
    DockerSandboxOptions options_;
    DockerRunner runner_;
    SandboxSettings settings_;
    std::string container_id_;

    utils::ProcessResult Docker(const std::vector<std::string>& args,
                                std::chrono::milliseconds timeout) const;
    void ValidateSettings(const SandboxSettings& settings) const;
    std::string GenerateContainerName() const;
    static bool IsSafeRelativePath(const std::filesystem::path& path);
};

} // namespace core
} // namespace sandrun
