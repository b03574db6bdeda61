/**
 * @file execution_result.hpp
 * @brief Execution request, structured result and failure taxonomy
 *
 * A request is immutable once submitted. A result is produced exactly once
 * per request and is fully populated by either the success path or one
 * failure path. Failure causes form a closed set modelled as a variant; the
 * result's error kind is derived from the active alternative.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sandrun {
namespace core {

/**
 * @struct ExecutionRequest
 * @brief One code execution request
 */
struct ExecutionRequest {
    std::string code;                   ///< Python source, written verbatim
    int timeout_seconds{30};            ///< Execution budget (must be > 0)
    std::vector<std::string> packages;  ///< pip packages to install first
    bool allow_network{false};          ///< Network posture for a new environment
    bool auto_terminate{false};         ///< Tear the environment down afterwards
};

/**
 * @enum ErrorKind
 * @brief Failure classification surfaced to callers
 */
enum class ErrorKind {
    DEPENDENCY_INSTALL_FAILED,  ///< Batched pip install faulted or timed out
    EXECUTION_TIMED_OUT,        ///< Code exceeded timeout_seconds
    EXECUTION_FAULTED,          ///< Code exited abnormally
    PROVISIONING_FAILED,        ///< Environment could not be created or reached
    INVALID_REQUEST             ///< Request rejected before touching the sandbox
};

/// Install batch failed; nothing from it is recorded as installed
struct DependencyInstallFailure {
    std::vector<std::string> packages;
    std::string diagnostic;
};

/// Run command exceeded its budget
struct ExecutionTimeout {
    int timeout_seconds{0};
    std::string diagnostic;
};

/// Run command failed for any other reason
struct ExecutionFault {
    std::string diagnostic;
};

/// Environment unavailable at any step
struct ProvisioningFailure {
    std::string diagnostic;
};

/// Request failed validation
struct InvalidRequest {
    std::string diagnostic;
};

using FailureCause = std::variant<DependencyInstallFailure,
                                  ExecutionTimeout,
                                  ExecutionFault,
                                  ProvisioningFailure,
                                  InvalidRequest>;

/**
 * @brief Error kind of a failure cause
 */
ErrorKind KindOf(const FailureCause& cause);

/**
 * @brief Diagnostic text carried by a failure cause
 */
const std::string& DiagnosticOf(const FailureCause& cause);

/**
 * @brief Stable identifier of an error kind (e.g. "ExecutionTimedOut")
 */
std::string ErrorKindToString(ErrorKind kind);

/**
 * @struct ExecutionResult
 * @brief Structured outcome of one request
 */
struct ExecutionResult {
    bool succeeded{false};                     ///< Code ran and exited normally
    std::string raw_output;                    ///< Captured standard output (may be empty)
    std::optional<ErrorKind> error_kind;       ///< Set on every failure
    std::string human_message;                 ///< Caller-facing message, never empty
    std::string error_detail;                  ///< Raw diagnostic of the failure

    int timeout_seconds{0};                    ///< Execution budget that applied
    std::optional<bool> network_enabled;       ///< Actual posture of the environment used
    std::vector<std::string> installed_packages;  ///< Installed by this request
    std::chrono::milliseconds duration{0};     ///< Wall time of the request
};

/**
 * @brief Serialize a result for machine consumers
 *
 * Keys: succeeded, output, error_kind (null on success), message, error,
 * timeout_seconds, network_enabled (null if no environment), installed_packages,
 * duration_ms.
 */
nlohmann::json ResultToJson(const ExecutionResult& result);

/**
 * @brief Render ResultToJson() as text
 *
 * Program output is arbitrary bytes; invalid UTF-8 sequences are replaced
 * with U+FFFD instead of failing the dump.
 */
std::string ResultToJsonString(const ExecutionResult& result, int indent = 2);

} // namespace core
} // namespace sandrun
