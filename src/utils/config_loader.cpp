/**
 * @file config_loader.cpp
 * @brief Implementation of JSON configuration loading
 *
 * @date 2025
 */

#include "sandrun/utils/config_loader.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace sandrun {
namespace utils {

namespace {

const json& Section(const json& document, const char* name) {
    static const json empty = json::object();

    if (!document.contains(name)) {
        return empty;
    }
    const json& section = document.at(name);
    if (!section.is_object()) {
        throw ConfigError(std::string("Section '") + name + "' must be an object");
    }
    return section;
}

template <typename T>
T Read(const json& section, const char* section_name, const char* key, T fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    try {
        return section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + section_name + "." + key +
                          "': " + e.what());
    }
}

std::chrono::seconds ReadSeconds(const json& section, const char* section_name,
                                 const char* key, std::chrono::seconds fallback) {
    auto value = Read<long long>(section, section_name, key, fallback.count());
    if (value <= 0) {
        throw ConfigError(std::string("'") + section_name + "." + key +
                          "' must be a positive number of seconds");
    }
    return std::chrono::seconds(value);
}

} // anonymous namespace

AppConfig ConfigLoader::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return FromJson(document);
}

AppConfig ConfigLoader::FromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    AppConfig config;
    auto& orchestrator = config.orchestrator;
    auto& sandbox = orchestrator.sandbox;

    const json& s = Section(document, "sandbox");
    sandbox.image = Read<std::string>(s, "sandbox", "image", sandbox.image);
    sandbox.work_dir = Read<std::string>(s, "sandbox", "work_dir", sandbox.work_dir.string());
    sandbox.memory_limit = Read<std::string>(s, "sandbox", "memory_limit", sandbox.memory_limit);
    sandbox.cpu_limit = Read<double>(s, "sandbox", "cpu_limit", sandbox.cpu_limit);
    sandbox.pids_limit = Read<int>(s, "sandbox", "pids_limit", sandbox.pids_limit);
    sandbox.timeout = ReadSeconds(s, "sandbox", "timeout", sandbox.timeout);
    sandbox.network_enabled = Read<bool>(s, "sandbox", "network_enabled", sandbox.network_enabled);

    const json& e = Section(document, "execution");
    orchestrator.install_timeout = ReadSeconds(e, "execution", "install_timeout",
                                               orchestrator.install_timeout);
    orchestrator.script_filename = Read<std::string>(e, "execution", "script_filename",
                                                     orchestrator.script_filename);
    orchestrator.interpreter = Read<std::string>(e, "execution", "interpreter",
                                                 orchestrator.interpreter);
    orchestrator.recreate_on_network_change = Read<bool>(e, "execution", "recreate_on_network_change",
                                                         orchestrator.recreate_on_network_change);
    config.kill_grace = ReadSeconds(e, "execution", "kill_grace", config.kill_grace);

    if (sandbox.image.empty()) {
        throw ConfigError("'sandbox.image' must not be empty");
    }
    if (sandbox.cpu_limit <= 0.0) {
        throw ConfigError("'sandbox.cpu_limit' must be positive");
    }
    if (sandbox.pids_limit <= 0) {
        throw ConfigError("'sandbox.pids_limit' must be positive");
    }
    if (orchestrator.script_filename.empty() || orchestrator.interpreter.empty()) {
        throw ConfigError("'execution.script_filename' and 'execution.interpreter' must not be empty");
    }

    return config;
}

json ConfigLoader::ToJson(const AppConfig& config) {
    const auto& orchestrator = config.orchestrator;
    const auto& sandbox = orchestrator.sandbox;

    return json{
        {"sandbox", {
            {"image", sandbox.image},
            {"work_dir", sandbox.work_dir.string()},
            {"memory_limit", sandbox.memory_limit},
            {"cpu_limit", sandbox.cpu_limit},
            {"pids_limit", sandbox.pids_limit},
            {"timeout", sandbox.timeout.count()},
            {"network_enabled", sandbox.network_enabled}
        }},
        {"execution", {
            {"install_timeout", orchestrator.install_timeout.count()},
            {"script_filename", orchestrator.script_filename},
            {"interpreter", orchestrator.interpreter},
            {"recreate_on_network_change", orchestrator.recreate_on_network_change},
            {"kill_grace", config.kill_grace.count()}
        }}
    };
}

} // namespace utils
} // namespace sandrun
