#include <gtest/gtest.h>
#include "runtime/child_process.hpp"
#include "runtime/cgroup.hpp"
#include "runtime/temp_workspace.hpp"
#include "test_support.hpp"

#include <signal.h>
#include <unistd.h>

namespace runbox::runtime {
namespace {

using namespace std::chrono_literals;
using testing_support::seconds_since;

ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", script};
    return spec;
}

TEST(ChildProcessTest, CapturesBothStreams) {
    auto outcome = run_process(shell("echo out; echo err 1>&2"), 5s, 500ms);

    ASSERT_TRUE(outcome.launched) << outcome.launch_error;
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "out\n");
    EXPECT_EQ(outcome.stderr_text, "err\n");
    EXPECT_FALSE(outcome.timed_out);
}

TEST(ChildProcessTest, ReportsExitCode) {
    auto outcome = run_process(shell("exit 7"), 5s, 500ms);
    ASSERT_TRUE(outcome.launched);
    EXPECT_EQ(outcome.exit_code, 7);
}

TEST(ChildProcessTest, SignalDeathMapsTo128PlusSignal) {
    auto outcome = run_process(shell("kill -9 $$"), 5s, 500ms);
    ASSERT_TRUE(outcome.launched);
    EXPECT_EQ(outcome.term_signal, SIGKILL);
    EXPECT_EQ(outcome.exit_code, 128 + SIGKILL);
}

TEST(ChildProcessTest, MissingExecutableIsLaunchFailure) {
    ProcessSpec spec;
    spec.argv = {"runbox-no-such-interpreter", "x"};
    auto outcome = run_process(spec, 5s, 500ms);

    EXPECT_FALSE(outcome.launched);
    EXPECT_NE(outcome.launch_error.find("not found"), std::string::npos);
}

TEST(ChildProcessTest, BadWorkingDirectoryIsLaunchFailure) {
    ProcessSpec spec = shell("true");
    spec.working_dir = "/nonexistent/runbox/dir";
    auto outcome = run_process(spec, 5s, 500ms);

    EXPECT_FALSE(outcome.launched);
    EXPECT_NE(outcome.launch_error.find("working directory"), std::string::npos);
}

TEST(ChildProcessTest, TimeoutKillsWithinGrace) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = run_process(shell("sleep 30"), 1s, 500ms);

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_LT(seconds_since(start), 3.0);
}

TEST(ChildProcessTest, IgnoredSigtermEscalatesToSigkill) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = run_process(shell("trap '' TERM; while true; do sleep 0.1; done"), 500ms, 300ms);

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_TRUE(outcome.force_killed);
    EXPECT_LT(seconds_since(start), 3.0);
}

TEST(ChildProcessTest, BackgroundChildrenDoNotHoldTheCall) {
    // The grandchild inherits stdout; the group kill must reclaim it
    auto start = std::chrono::steady_clock::now();
    auto outcome = run_process(shell("sleep 30 & echo started"), 10s, 500ms);

    ASSERT_TRUE(outcome.launched);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_text, "started\n");
    EXPECT_LT(seconds_since(start), 3.0);
}

TEST(ChildProcessTest, OutputIsCapped) {
    ProcessSpec spec = shell("yes runbox | head -c 100000");
    spec.max_output_bytes = 1000;
    auto outcome = run_process(spec, 5s, 500ms);

    EXPECT_EQ(outcome.stdout_text.size(), 1000u);
    EXPECT_TRUE(outcome.stdout_truncated);
    EXPECT_TRUE(outcome.truncated());
}

TEST(ChildProcessTest, WorkingDirectoryAndEnvironment) {
    std::string error;
    auto workspace = TempWorkspace::create("runbox-cp-test", &error);
    ASSERT_TRUE(workspace) << error;

    ProcessSpec spec = shell("pwd; echo $RUNBOX_TEST_VALUE");
    spec.working_dir = workspace->path().string();
    spec.env = {{"RUNBOX_TEST_VALUE", "42"}};
    spec.clear_environment = true;
    auto outcome = run_process(spec, 5s, 500ms);

    ASSERT_TRUE(outcome.launched) << outcome.launch_error;
    EXPECT_EQ(outcome.stdout_text, workspace->path().string() + "\n42\n");
}

TEST(ChildProcessTest, StdinIsEmpty) {
    auto outcome = run_process(shell("cat; echo done"), 5s, 500ms);
    EXPECT_EQ(outcome.stdout_text, "done\n");
}

TEST(ChildProcessTest, ResourceCeilingsAreApplied) {
    ProcessSpec spec = shell("ulimit -n");
    spec.limits.open_files = 32;
    auto outcome = run_process(spec, 5s, 500ms);

    ASSERT_TRUE(outcome.launched);
    EXPECT_TRUE(outcome.rlimits_applied);
    EXPECT_EQ(outcome.stdout_text, "32\n");
}

TEST(ChildProcessTest, IsolatedNetworkHasOnlyLoopback) {
    ProcessSpec spec;
    spec.argv = {"cat", "/proc/net/dev"};
    spec.isolate_network = true;
    auto outcome = run_process(spec, 5s, 500ms);

    ASSERT_TRUE(outcome.launched) << outcome.launch_error;
    if (!outcome.network_isolated) GTEST_SKIP() << "network namespaces unavailable here";
    EXPECT_EQ(testing_support::interfaces_in(outcome.stdout_text), std::vector<std::string>{"lo"});
}

TEST(ChildProcessTest, NetworkIsSharedUnlessRequested) {
    ProcessSpec spec;
    spec.argv = {"cat", "/proc/net/dev"};
    auto outcome = run_process(spec, 5s, 500ms);

    ASSERT_TRUE(outcome.launched) << outcome.launch_error;
    EXPECT_FALSE(outcome.network_isolated);
    EXPECT_FALSE(testing_support::interfaces_in(outcome.stdout_text).empty());
}

TEST(ChildProcessTest, SpawnHookSeesChildBeforeExec) {
    pid_t seen = -1;
    ChildProcess child(shell("echo $$"));
    ASSERT_TRUE(child.spawn([&](pid_t pid) { seen = pid; }));
    const auto& outcome = child.communicate(5s, 500ms);

    EXPECT_EQ(seen, child.pid());
    EXPECT_EQ(outcome.stdout_text, std::to_string(seen) + "\n");
}

TEST(ChildProcessTest, DestructorReapsRunningChild) {
    pid_t pid;
    {
        ChildProcess child(shell("sleep 30"));
        ASSERT_TRUE(child.spawn());
        pid = child.pid();
        EXPECT_TRUE(child.running());
    }
    EXPECT_EQ(kill(pid, 0), -1);
}

TEST(ResolveExecutableTest, FindsShell) {
    EXPECT_FALSE(resolve_executable("sh").empty());
    EXPECT_TRUE(resolve_executable("runbox-no-such-interpreter").empty());
    EXPECT_TRUE(resolve_executable("/nonexistent/bin/sh").empty());
}

TEST(TempWorkspaceTest, RemovedOnDestruction) {
    std::string error;
    std::filesystem::path dir;
    {
        auto workspace = TempWorkspace::create("runbox-ws-test", &error);
        ASSERT_TRUE(workspace) << error;
        dir = workspace->path();

        auto file = workspace->write_file("code.py", "print(1)", &error);
        ASSERT_FALSE(file.empty()) << error;
        EXPECT_TRUE(std::filesystem::exists(file));

        auto perms = std::filesystem::status(dir).permissions();
        EXPECT_EQ(perms & std::filesystem::perms::all, std::filesystem::perms::owner_all);

        ASSERT_TRUE(workspace->share_read_only(&error)) << error;
        perms = std::filesystem::status(file).permissions();
        EXPECT_NE(perms & std::filesystem::perms::others_read, std::filesystem::perms::none);
    }
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST(CgroupScopeTest, DegradesWithoutWritableHierarchy) {
    CgroupScope scope("runbox-test-" + std::to_string(getpid()), CgroupLimits{64ULL << 20, 16},
                      "/nonexistent/cgroup/runbox");
    EXPECT_FALSE(scope.create());
    EXPECT_FALSE(scope.active());
    EXPECT_FALSE(scope.degraded_reason().empty());
}

} // namespace
} // namespace runbox::runtime
