/**
 * @file execution_result.cpp
 * @brief Failure taxonomy helpers and JSON serialization of results
 *
 * @date 2025
 */

#include "sandrun/core/execution_result.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

using json = nlohmann::json;

namespace sandrun {
namespace core {

ErrorKind KindOf(const FailureCause& cause) {
    return std::visit([](const auto& c) -> ErrorKind {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, DependencyInstallFailure>) {
            return ErrorKind::DEPENDENCY_INSTALL_FAILED;
        } else if constexpr (std::is_same_v<T, ExecutionTimeout>) {
            return ErrorKind::EXECUTION_TIMED_OUT;
        } else if constexpr (std::is_same_v<T, ExecutionFault>) {
            return ErrorKind::EXECUTION_FAULTED;
        } else if constexpr (std::is_same_v<T, ProvisioningFailure>) {
            return ErrorKind::PROVISIONING_FAILED;
        } else {
            return ErrorKind::INVALID_REQUEST;
        }
    }, cause);
}

const std::string& DiagnosticOf(const FailureCause& cause) {
    return std::visit([](const auto& c) -> const std::string& { return c.diagnostic; }, cause);
}

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DEPENDENCY_INSTALL_FAILED: return "DependencyInstallFailed";
        case ErrorKind::EXECUTION_TIMED_OUT: return "ExecutionTimedOut";
        case ErrorKind::EXECUTION_FAULTED: return "ExecutionFaulted";
        case ErrorKind::PROVISIONING_FAILED: return "ProvisioningFailed";
        case ErrorKind::INVALID_REQUEST: return "InvalidRequest";
    }
    return "Unknown";
}

json ResultToJson(const ExecutionResult& result) {
    json j;

    j["succeeded"] = result.succeeded;
    j["output"] = result.raw_output;
    j["error_kind"] = result.error_kind ? json(ErrorKindToString(*result.error_kind)) : json(nullptr);
    j["message"] = result.human_message;
    j["error"] = result.error_detail;
    j["timeout_seconds"] = result.timeout_seconds;
    j["network_enabled"] = result.network_enabled ? json(*result.network_enabled) : json(nullptr);
    j["installed_packages"] = result.installed_packages;
    j["duration_ms"] = result.duration.count();

    return j;
}

std::string ResultToJsonString(const ExecutionResult& result, int indent) {
    return ResultToJson(result).dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace core
} // namespace sandrun
