/**
 * @file config_loader.hpp
 * @brief JSON configuration of the sandrun tool
 *
 * Example configuration file:
 * ```json
 * {
 *   "sandbox": {
 *     "image": "python:3.12-slim",
 *     "work_dir": "/workspace",
 *     "memory_limit": "512m",
 *     "cpu_limit": 1.0,
 *     "pids_limit": 100,
 *     "timeout": 300,
 *     "network_enabled": false
 *   },
 *   "execution": {
 *     "install_timeout": 120,
 *     "script_filename": "execution_script.py",
 *     "interpreter": "python",
 *     "recreate_on_network_change": false,
 *     "kill_grace": 5
 *   }
 * }
 * ```
 * Missing keys keep their defaults.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/core/execution_orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace sandrun {
namespace utils {

/**
 * @class ConfigError
 * @brief Unreadable or malformed configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct AppConfig
 * @brief Everything the CLI needs to build an orchestrator
 */
struct AppConfig {
    core::OrchestratorConfig orchestrator;     ///< Sandbox defaults and execution settings
    std::chrono::seconds kill_grace{5};        ///< Host-side slack after a command deadline
};

/**
 * @class ConfigLoader
 * @brief Reads and writes AppConfig as JSON
 *
 * All methods are static - no instantiation required.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a JSON file
     * @param path Configuration file
     * @return Parsed configuration
     * @throws ConfigError if the file cannot be read or is invalid
     */
    static AppConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Build configuration from a parsed JSON document
     * @throws ConfigError on wrong types or out-of-range values
     */
    static AppConfig FromJson(const nlohmann::json& document);

    /**
     * @brief Serialize configuration (same schema as LoadFromFile)
     */
    static nlohmann::json ToJson(const AppConfig& config);
};

} // namespace utils
} // namespace sandrun
