#include "sandrun/core/execution_result.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

namespace {

using ::testing::ElementsAre;
using ::testing::StartsWith;

using namespace sandrun::core;  // NOLINT

// NOLINTNEXTLINE
TEST(FailureCause, KindFollowsAlternative) {
    EXPECT_EQ(KindOf(DependencyInstallFailure{{"x"}, "d"}), ErrorKind::DEPENDENCY_INSTALL_FAILED);
    EXPECT_EQ(KindOf(ExecutionTimeout{5, "d"}), ErrorKind::EXECUTION_TIMED_OUT);
    EXPECT_EQ(KindOf(ExecutionFault{"d"}), ErrorKind::EXECUTION_FAULTED);
    EXPECT_EQ(KindOf(ProvisioningFailure{"d"}), ErrorKind::PROVISIONING_FAILED);
    EXPECT_EQ(KindOf(InvalidRequest{"d"}), ErrorKind::INVALID_REQUEST);
}

// NOLINTNEXTLINE
TEST(FailureCause, DiagnosticOfAnyAlternative) {
    FailureCause cause = ExecutionTimeout{3, "Command timed out after 3s"};
    EXPECT_EQ(DiagnosticOf(cause), "Command timed out after 3s");

    cause = DependencyInstallFailure{{"a", "b"}, "pip failed"};
    EXPECT_EQ(DiagnosticOf(cause), "pip failed");
}

// NOLINTNEXTLINE
TEST(ErrorKind, StableNames) {
    EXPECT_EQ(ErrorKindToString(ErrorKind::DEPENDENCY_INSTALL_FAILED), "DependencyInstallFailed");
    EXPECT_EQ(ErrorKindToString(ErrorKind::EXECUTION_TIMED_OUT), "ExecutionTimedOut");
    EXPECT_EQ(ErrorKindToString(ErrorKind::EXECUTION_FAULTED), "ExecutionFaulted");
    EXPECT_EQ(ErrorKindToString(ErrorKind::PROVISIONING_FAILED), "ProvisioningFailed");
    EXPECT_EQ(ErrorKindToString(ErrorKind::INVALID_REQUEST), "InvalidRequest");
}

// NOLINTNEXTLINE
TEST(ResultToJson, Success) {
    ExecutionResult result;
    result.succeeded = true;
    result.raw_output = "2\n";
    result.human_message = "Code execution completed successfully!";
    result.timeout_seconds = 30;
    result.network_enabled = false;
    result.installed_packages = {"numpy"};
    result.duration = std::chrono::milliseconds(1234);

    auto j = ResultToJson(result);

    EXPECT_TRUE(j["succeeded"].get<bool>());
    EXPECT_EQ(j["output"], "2\n");
    EXPECT_TRUE(j["error_kind"].is_null());
    EXPECT_EQ(j["timeout_seconds"], 30);
    EXPECT_FALSE(j["network_enabled"].get<bool>());
    EXPECT_THAT(j["installed_packages"].get<std::vector<std::string>>(), ElementsAre("numpy"));
    EXPECT_EQ(j["duration_ms"], 1234);
}

// NOLINTNEXTLINE
TEST(ResultToJson, FailureWithoutEnvironment) {
    ExecutionResult result;
    result.error_kind = ErrorKind::PROVISIONING_FAILED;
    result.human_message = "Sandbox environment unavailable";
    result.error_detail = "daemon not running";

    auto j = ResultToJson(result);

    EXPECT_FALSE(j["succeeded"].get<bool>());
    EXPECT_EQ(j["error_kind"], "ProvisioningFailed");
    EXPECT_EQ(j["error"], "daemon not running");
    EXPECT_TRUE(j["network_enabled"].is_null());
}

// NOLINTNEXTLINE
TEST(ResultToJsonString, InvalidUtf8OutputIsReplaced) {
    ExecutionResult result;
    result.succeeded = true;
    result.raw_output = "caf\xe9\n";
    result.human_message = "Output:\n\ncaf\xe9\n";

    std::string text;
    ASSERT_NO_THROW(text = ResultToJsonString(result));

    auto j = nlohmann::json::parse(text);
    EXPECT_THAT(j["output"].get<std::string>(), StartsWith("caf\xef\xbf\xbd"));
    EXPECT_TRUE(j["succeeded"].get<bool>());
}

}  // namespace
