#include <gtest/gtest.h>
#include "runtime/sandbox_manager.hpp"
#include "runtime/process_sandbox.hpp"
#include "test_support.hpp"

#include <stdexcept>

namespace runbox::runtime {
namespace {

using namespace testing_support;

// Backend with scripted behaviour that counts how often it is used
class CountingBackend : public IsolationBackend {
public:
    CountingBackend(std::string name, std::shared_ptr<const LanguageTable> languages)
        : IsolationBackend(quick_config(), std::move(languages)), name_(std::move(name)) {}

    std::string name() const override { return name_; }

    BackendAvailability probe() const override {
        probes++;
        if (probe_throws) throw std::runtime_error("probe exploded");
        return BackendAvailability{name_, available, available ? "" : "engine down"};
    }

    bool available = true;
    bool probe_throws = false;
    bool run_throws = false;
    bool report_infrastructure = false;
    mutable int probes = 0;
    int runs = 0;

protected:
    void run(const ExecutionContext& ctx, ExecutionResult& result) override {
        runs++;
        if (run_throws) throw std::runtime_error("run exploded");
        if (report_infrastructure) {
            result.fail(ErrorKind::INFRASTRUCTURE_UNAVAILABLE, "Container engine unavailable: gone");
            return;
        }
        result.output = ctx.request.code();
        result.exit_code = 0;
        result.success = true;
    }

private:
    std::string name_;
};

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        languages_ = default_languages();
        manager_ = std::make_unique<SandboxManager>(languages_);

        auto process = std::make_unique<CountingBackend>("process", languages_);
        auto limited = std::make_unique<CountingBackend>("resource_limited", languages_);
        auto container = std::make_unique<CountingBackend>("container", languages_);
        process_ = process.get();
        limited_ = limited.get();
        container_ = container.get();
        manager_->add_backend(std::move(process));
        manager_->add_backend(std::move(limited));
        manager_->add_backend(std::move(container));
    }

    int total_runs() const { return process_->runs + limited_->runs + container_->runs; }

    std::shared_ptr<const LanguageTable> languages_;
    std::unique_ptr<SandboxManager> manager_;
    CountingBackend* process_ = nullptr;
    CountingBackend* limited_ = nullptr;
    CountingBackend* container_ = nullptr;
};

TEST_F(SandboxManagerTest, DefaultBackendIsResourceLimited) {
    auto result = manager_->execute("echo hi", "shell");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.backend, "resource_limited");
    EXPECT_EQ(limited_->runs, 1);
}

TEST_F(SandboxManagerTest, UnknownLanguageInvokesNoBackend) {
    auto result = manager_->execute("x", "cobol", "process");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind(), ErrorKind::UNSUPPORTED_LANGUAGE);
    EXPECT_NE(result.error_text().find("python"), std::string::npos);
    EXPECT_EQ(total_runs(), 0);
    EXPECT_EQ(process_->probes, 0);
}

TEST_F(SandboxManagerTest, UnknownLanguageWinsOverUnknownBackend) {
    auto result = manager_->execute("x", "cobol", "nonexistent");
    EXPECT_EQ(result.error_kind(), ErrorKind::UNSUPPORTED_LANGUAGE);
}

TEST_F(SandboxManagerTest, UnknownBackend) {
    auto result = manager_->execute("x", "python", "nonexistent");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind(), ErrorKind::BACKEND_UNAVAILABLE);
    EXPECT_NE(result.error_text().find("nonexistent"), std::string::npos);
    EXPECT_EQ(total_runs(), 0);
}

TEST_F(SandboxManagerTest, BackendAliases) {
    EXPECT_EQ(manager_->execute("1", "python", "simple").backend, "process");
    EXPECT_EQ(manager_->execute("1", "python", "safe").backend, "resource_limited");
    EXPECT_EQ(manager_->execute("1", "python", "Docker").backend, "container");
    EXPECT_EQ(SandboxManager::canonical_name("SIMPLE"), "process");
}

TEST_F(SandboxManagerTest, UnavailableBackendIsReportedNotRun) {
    container_->available = false;
    auto result = manager_->execute("print(1)", "python", "container");

    EXPECT_EQ(result.error_kind(), ErrorKind::BACKEND_UNAVAILABLE);
    EXPECT_NE(result.error_text().find("engine down"), std::string::npos);
    EXPECT_EQ(container_->runs, 0);

    // Recovers once the backend comes back
    container_->available = true;
    EXPECT_TRUE(manager_->execute("print(1)", "python", "container").success);
}

TEST_F(SandboxManagerTest, AvailabilityIsCachedWhileUp) {
    manager_->execute("1", "python", "process");
    manager_->execute("2", "python", "process");
    EXPECT_EQ(process_->probes, 1);
}

TEST_F(SandboxManagerTest, InfrastructureFailureMarksBackendDown) {
    container_->report_infrastructure = true;
    manager_->execute("1", "python", "container");
    int probes = container_->probes;

    container_->report_infrastructure = false;
    manager_->execute("1", "python", "container");
    EXPECT_EQ(container_->probes, probes + 1);
}

TEST_F(SandboxManagerTest, ThrowingRunBecomesInternalError) {
    process_->run_throws = true;
    auto result = manager_->execute("1", "python", "process");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind(), ErrorKind::INTERNAL);
    EXPECT_NE(result.error_text().find("run exploded"), std::string::npos);
}

TEST_F(SandboxManagerTest, ThrowingProbeBecomesInternalError) {
    process_->probe_throws = true;
    auto result = manager_->execute("1", "python", "process");

    EXPECT_EQ(result.error_kind(), ErrorKind::INTERNAL);
    EXPECT_EQ(result.backend, "process");
}

TEST_F(SandboxManagerTest, CompareCoversEveryBackend) {
    container_->available = false;
    auto results = manager_->compare("print(1)", "python");

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results.at("process").success);
    EXPECT_TRUE(results.at("resource_limited").success);
    EXPECT_EQ(results.at("container").error_kind(), ErrorKind::BACKEND_UNAVAILABLE);
}

TEST_F(SandboxManagerTest, AvailabilityProbesAll) {
    container_->available = false;
    auto report = manager_->availability();

    ASSERT_EQ(report.size(), 3u);
    EXPECT_TRUE(report.at("process").available);
    EXPECT_FALSE(report.at("container").available);
    EXPECT_EQ(report.at("container").detail, "engine down");
}

TEST_F(SandboxManagerTest, BenchmarkCollectsStats) {
    limited_->run_throws = true;
    auto report = manager_->benchmark("print(1)", "python", 3);

    const auto& process = report.at("process");
    EXPECT_EQ(process.runs, 3);
    EXPECT_EQ(process.successes, 3);
    EXPECT_LE(process.min_seconds, process.mean_seconds);
    EXPECT_LE(process.mean_seconds, process.max_seconds);

    const auto& limited = report.at("resource_limited");
    EXPECT_EQ(limited.runs, 1);
    EXPECT_EQ(limited.successes, 0);
    EXPECT_NE(limited.error.find("InternalError"), std::string::npos);

    EXPECT_THROW(manager_->benchmark("1", "python", 0), std::invalid_argument);
}

TEST_F(SandboxManagerTest, EmptyLanguageIsRejected) {
    EXPECT_THROW(manager_->execute("1", ""), std::invalid_argument);
}

TEST_F(SandboxManagerTest, InfoIncludesAvailability) {
    EXPECT_TRUE(manager_->info("nonexistent").is_null());

    manager_->availability();
    auto j = manager_->info("simple");
    EXPECT_EQ(j["backend"], "process");
    EXPECT_TRUE(j["availability"]["available"].get<bool>());
}

TEST_F(SandboxManagerTest, AddBackendReplacesSameName) {
    manager_->add_backend(std::make_unique<ProcessSandbox>(quick_config(), languages_));
    EXPECT_EQ(manager_->backend_names().size(), 3u);
    EXPECT_EQ(manager_->execute("echo real", "shell", "process").output, "real\n");
}

TEST(SandboxManagerDefaultTest, RegistersThreeBackends) {
    util::Settings settings;
    settings.docker_binary = "runbox-no-such-docker";
    auto manager = SandboxManager::create_default(settings);

    auto names = manager->backend_names();
    EXPECT_EQ(names, (std::vector<std::string>{"process", "resource_limited", "container"}));

    auto result = manager->execute("print(1)", "python", "container");
    EXPECT_EQ(result.error_kind(), ErrorKind::BACKEND_UNAVAILABLE);
}

TEST(SandboxManagerDefaultTest, BadLanguagesFileFallsBack) {
    util::Settings settings;
    settings.languages_file = "/nonexistent/runbox-languages.json";
    auto manager = SandboxManager::create_default(settings);
    EXPECT_TRUE(manager->languages().supports("python"));
}

} // namespace
} // namespace runbox::runtime
