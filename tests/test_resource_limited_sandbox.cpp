#include <gtest/gtest.h>
#include "runtime/resource_limited_sandbox.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace runbox::runtime {
namespace {

using namespace std::chrono_literals;
using namespace testing_support;

SandboxConfig screened_config() {
    SandboxConfig config = quick_config();
    config.security_screen_enabled = true;
    return config;
}

class ResourceLimitedSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        sandbox_ = std::make_unique<ResourceLimitedSandbox>(
            screened_config(), default_languages(), security::make_safety_policy(true));
    }

    std::unique_ptr<ResourceLimitedSandbox> sandbox_;
};

TEST_F(ResourceLimitedSandboxTest, RejectedCodeNeverRuns) {
    size_t before = count_workspaces();
    auto result = sandbox_->execute("sudo ls", "shell");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind(), ErrorKind::VALIDATION);
    EXPECT_EQ(result.error_text().rfind("Security check failed:", 0), 0u);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_TRUE(result.output.empty());
    EXPECT_FALSE(result.isolation);
    EXPECT_EQ(count_workspaces(), before);
}

TEST_F(ResourceLimitedSandboxTest, PythonImportOfOsIsRejected) {
    auto result = sandbox_->execute("import os\nprint(os.getcwd())", "python");
    EXPECT_EQ(result.error_kind(), ErrorKind::VALIDATION);
    EXPECT_NE(result.error_text().find("os"), std::string::npos);
}

TEST_F(ResourceLimitedSandboxTest, OverlongLineIsAValidationResult) {
    std::string code = "import math";
    for (int i = 0; i < 20000; i++) code += ", math";
    auto result = sandbox_->execute(code, "python");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind(), ErrorKind::VALIDATION);
}

TEST_F(ResourceLimitedSandboxTest, AllowedCodeRunsWithIsolationStatus) {
    auto result = sandbox_->execute("echo limited", "shell");

    EXPECT_TRUE(result.success) << result.error_text();
    EXPECT_EQ(result.output, "limited\n");
    EXPECT_EQ(result.backend, "resource_limited");
    ASSERT_TRUE(result.isolation);
    EXPECT_TRUE(result.isolation->rlimits_applied);
    if (!result.isolation->cgroup_applied) {
        EXPECT_TRUE(result.isolation->is_degraded());
    }
}

TEST_F(ResourceLimitedSandboxTest, NetworkDisabledMeansPrivateNamespace) {
    auto result = sandbox_->execute("cat /proc/net/dev", "shell");

    ASSERT_TRUE(result.success) << result.error_text();
    ASSERT_TRUE(result.isolation);
    if (result.isolation->network_namespace) {
        EXPECT_EQ(interfaces_in(result.output), std::vector<std::string>{"lo"});
    } else {
        EXPECT_NE(result.isolation->degraded_reason.find("network namespace"), std::string::npos);
    }
}

TEST_F(ResourceLimitedSandboxTest, NetworkEnabledSkipsNamespace) {
    ExecutionOptions options;
    options.network_enabled = true;
    auto result = sandbox_->execute(ExecutionRequest("cat /proc/net/dev", "shell", options));

    ASSERT_TRUE(result.success) << result.error_text();
    ASSERT_TRUE(result.isolation);
    EXPECT_FALSE(result.isolation->network_namespace);
    EXPECT_EQ(result.isolation->degraded_reason.find("network namespace"), std::string::npos);
}

TEST_F(ResourceLimitedSandboxTest, EnvironmentIsScrubbed) {
    setenv("RUNBOX_SECRET_TOKEN", "leak", 1);
    auto result = sandbox_->execute("echo \"[$RUNBOX_SECRET_TOKEN]\"", "shell");
    unsetenv("RUNBOX_SECRET_TOKEN");

    ASSERT_TRUE(result.success) << result.error_text();
    EXPECT_EQ(result.output, "[]\n");
}

TEST_F(ResourceLimitedSandboxTest, TimeoutStillEnforced) {
    ExecutionOptions options;
    options.timeout = 1s;
    auto start = std::chrono::steady_clock::now();
    auto result = sandbox_->execute(ExecutionRequest("while true; do :; done", "shell", options));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind(), ErrorKind::TIMEOUT);
    EXPECT_LT(seconds_since(start), 4.0);
}

TEST_F(ResourceLimitedSandboxTest, MemoryBlowUpFails) {
    if (!have_python()) GTEST_SKIP() << "python3 not installed";

    ExecutionOptions options;
    options.memory_limit_bytes = 64ULL * 1024 * 1024;
    auto result = sandbox_->execute(
        ExecutionRequest("data = bytearray(512 * 1024 * 1024)\nprint(len(data))", "python", options));

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.exit_code, 0);
}

TEST(ResourceLimitedPolicyTest, DeferPolicyRunsFlaggedCode) {
    ResourceLimitedSandbox sandbox(screened_config(), default_languages(),
                                   security::make_safety_policy(false));

    auto result = sandbox.execute("echo sudo", "shell");
    EXPECT_TRUE(result.success) << result.error_text();
    EXPECT_EQ(result.output, "sudo\n");
}

TEST(ResourceLimitedPolicyTest, ScreenDisabledSkipsValidation) {
    ResourceLimitedSandbox sandbox(quick_config(), default_languages(),
                                   security::make_safety_policy(true));

    auto result = sandbox.execute("echo sudo", "shell");
    EXPECT_TRUE(result.success) << result.error_text();
}

TEST(ResourceLimitedPolicyTest, ConstructionAnnouncesOneBackend) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
    spdlog::set_level(spdlog::level::info);

    ResourceLimitedSandbox sandbox(quick_config(), default_languages(), security::make_safety_policy(true));

    spdlog::set_default_logger(previous);
    EXPECT_NE(captured.str().find("Resource-limited sandbox ready"), std::string::npos);
    EXPECT_EQ(captured.str().find("Process sandbox ready"), std::string::npos);
}

TEST(ResourceLimitedPolicyTest, NullPolicyThrows) {
    EXPECT_THROW(ResourceLimitedSandbox(quick_config(), default_languages(), nullptr),
                 std::invalid_argument);
}

TEST_F(ResourceLimitedSandboxTest, DescribeReportsLimitsAndPolicy) {
    auto j = sandbox_->describe();

    EXPECT_EQ(j["backend"], "resource_limited");
    EXPECT_EQ(j["limits"]["open_files"].get<uint64_t>(), ResourceLimitedSandbox::OPEN_FILES_LIMIT);
    EXPECT_EQ(j["policy"]["policy"], "deny_list");
    EXPECT_TRUE(j.contains("cgroup"));
}

TEST_F(ResourceLimitedSandboxTest, ProbeNamesBackend) {
    auto availability = sandbox_->probe();
    EXPECT_EQ(availability.backend, "resource_limited");
    EXPECT_TRUE(availability.available);
}

} // namespace
} // namespace runbox::runtime
