/**
 * @file main.cpp
 * @brief sandrun - Command-line interface
 *
 * Entry point for the sandrun tool. Runs a Python snippet inside an isolated
 * Docker sandbox, installing requested pip packages first, and prints the
 * classified outcome as a human-readable message or as JSON.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "sandrun/core/docker_sandbox.hpp"
#include "sandrun/core/execution_orchestrator.hpp"
#include "sandrun/utils/config_loader.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using json = nlohmann::json;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitExecutionFailed = 1;
constexpr int kExitUsageError = 2;

/*******************************************************************************
 * Input Functions
 ******************************************************************************/

std::string ReadCodeFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read code file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

std::string ReadCodeInteractive() {
    std::cout << "Enter Python code (type 'EOF' on a separate line to finish):" << std::endl;

    std::string code;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (sandrun::utils::StringUtils::ToLower(sandrun::utils::StringUtils::Trim(line)) == "eof") {
            break;
        }
        code += line;
        code += '\n';
    }
    return code;
}

/*******************************************************************************
 * Output Functions
 ******************************************************************************/

void PrintResult(const sandrun::core::ExecutionResult& result) {
    const std::string rule(60, '-');

    std::cout << "\nExecution result:\n";
    std::cout << rule << "\n";
    std::cout << result.human_message << "\n";
    std::cout << rule << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandrun - run Python code in an isolated Docker sandbox"};

    std::string code;
    std::string code_file;
    std::string packages;
    std::string config_path;
    int timeout = 30;
    bool network = false;
    bool keep_session = false;
    bool json_output = false;
    bool verbose = false;

    auto* code_opt = app.add_option("-c,--code", code, "Python code to execute");
    app.add_option("-f,--file", code_file, "Python file to execute")
        ->check(CLI::ExistingFile)
        ->excludes(code_opt);
    app.add_option("-p,--packages", packages, "Comma-separated list of pip packages to install");
    app.add_option("-t,--timeout", timeout, "Execution timeout in seconds")
        ->default_val(30)
        ->check(CLI::PositiveNumber);
    app.add_flag("-n,--network", network, "Enable network access inside the sandbox");
    app.add_flag("--keep-session", keep_session, "Do not tear the sandbox down after execution");
    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("--json", json_output, "Print the result as JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int status = app.exit(e);
        return status == 0 ? kExitSuccess : kExitUsageError;
    }

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        sandrun::utils::AppConfig config;
        if (!config_path.empty()) {
            config = sandrun::utils::ConfigLoader::LoadFromFile(config_path);
        }
        spdlog::debug("Effective configuration: {}",
                      sandrun::utils::ConfigLoader::ToJson(config).dump());

        const bool interactive = code.empty() && code_file.empty();
        if (!code_file.empty()) {
            code = ReadCodeFile(code_file);
        } else if (interactive) {
            code = ReadCodeInteractive();
        }

        if (sandrun::utils::StringUtils::Trim(code).empty()) {
            spdlog::error("No code provided");
            return kExitUsageError;
        }

        if (!sandrun::core::DockerSandbox::CheckDocker()) {
            spdlog::error("Docker is not available. Install Docker and make sure the daemon is running.");
            return kExitExecutionFailed;
        }

        sandrun::core::DockerSandboxOptions docker_options;
        docker_options.kill_grace = config.kill_grace;

        sandrun::core::ExecutionOrchestrator orchestrator(
            [docker_options] {
                return std::make_unique<sandrun::core::DockerSandbox>(docker_options);
            },
            config.orchestrator);

        int status = kExitSuccess;
        while (true) {
            sandrun::core::ExecutionRequest request;
            request.code = code;
            request.timeout_seconds = timeout;
            request.packages = sandrun::utils::StringUtils::ParsePackageList(packages);
            request.allow_network = network || config.orchestrator.sandbox.network_enabled;
            request.auto_terminate = !keep_session;

            spdlog::info("Executing code (timeout: {}s, network: {}, packages: {})",
                         request.timeout_seconds,
                         request.allow_network ? "enabled" : "disabled",
                         request.packages.empty()
                             ? std::string("none")
                             : sandrun::utils::StringUtils::Join(request.packages, ", "));

            auto result = orchestrator.Execute(request);

            if (json_output) {
                std::cout << sandrun::core::ResultToJsonString(result) << std::endl;
            } else {
                PrintResult(result);
            }
            status = result.succeeded ? kExitSuccess : kExitExecutionFailed;

            // Interactive sessions keep the sandbox (and its packages) for the next snippet
            if (!interactive || !keep_session || !std::cin) {
                break;
            }
            code = ReadCodeInteractive();
            if (sandrun::utils::StringUtils::Trim(code).empty()) {
                break;
            }
        }

        orchestrator.Reset();
        return status;

    } catch (const sandrun::utils::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitUsageError;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return kExitExecutionFailed;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitExecutionFailed;
    } catch (...) {
        spdlog::error("Unknown error occurred");
        return kExitExecutionFailed;
    }
}
