#include "sandrun/core/docker_sandbox.hpp"
#include "sandrun/core/execution_orchestrator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

using namespace sandrun::core;  // NOLINT

/*
 * End-to-end runs against a real Docker daemon. Skipped when docker is not
 * usable on the host; the image is pulled on first use.
 */
class DockerIntegrationTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        docker_available_ = DockerSandbox::CheckDocker();
    }

    void SetUp() override {
        if (!docker_available_) {
            GTEST_SKIP() << "Docker is not available";
        }
        orchestrator_ = std::make_unique<ExecutionOrchestrator>(
            [] { return std::make_unique<DockerSandbox>(); });
    }

    static ExecutionRequest Request(const std::string& code, int timeout_seconds) {
        ExecutionRequest request;
        request.code = code;
        request.timeout_seconds = timeout_seconds;
        return request;
    }

    static bool docker_available_;
    std::unique_ptr<ExecutionOrchestrator> orchestrator_;
};

bool DockerIntegrationTest::docker_available_ = false;

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, PrintsResult) {
    auto result = orchestrator_->Execute(Request("print(1+1)", 60));

    ASSERT_TRUE(result.succeeded) << result.human_message;
    EXPECT_THAT(result.raw_output, HasSubstr("2"));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, SleepTimesOut) {
    // Provision first so image startup does not count against the short budget
    ASSERT_TRUE(orchestrator_->Execute(Request("pass", 60)).succeeded);

    auto result = orchestrator_->Execute(Request("import time\ntime.sleep(100)", 2));

    EXPECT_FALSE(result.succeeded);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::EXECUTION_TIMED_OUT);
    EXPECT_LT(result.duration, std::chrono::seconds(30));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, ExceptionIsFault) {
    auto result = orchestrator_->Execute(Request("1/0", 60));

    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::EXECUTION_FAULTED);
    EXPECT_THAT(result.error_detail, HasSubstr("ZeroDivisionError"));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, EarlyExit124IsFault) {
    auto result = orchestrator_->Execute(Request("import sys; sys.exit(124)", 30));

    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::EXECUTION_FAULTED);
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, NetworkIsDisabledByDefault) {
    auto result = orchestrator_->Execute(Request(
        "import socket\n"
        "try:\n"
        "    socket.create_connection(('1.1.1.1', 53), timeout=3)\n"
        "    print('online')\n"
        "except OSError:\n"
        "    print('offline')\n", 60));

    ASSERT_TRUE(result.succeeded) << result.human_message;
    EXPECT_THAT(result.raw_output, HasSubstr("offline"));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, AutoTerminateRemovesContainer) {
    auto request = Request("print('bye')", 60);
    request.auto_terminate = true;

    auto result = orchestrator_->Execute(request);

    EXPECT_TRUE(result.succeeded) << result.human_message;
    EXPECT_FALSE(orchestrator_->HasEnvironment());
}

}  // namespace
