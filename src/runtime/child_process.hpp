/**
 * Child process launch and supervision.
 *
 * The child runs in its own process group with stdin on /dev/null and
 * stdout/stderr captured through pipes. Launch is two-phase: the child
 * reports readiness, the parent runs its spawn hook (cgroup placement),
 * then releases the child to exec. Exec failures come back on a CLOEXEC
 * pipe, so a missing interpreter is a launch error and not exit code 127.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace runbox::runtime {

// 0 = leave the inherited limit alone
struct ResourceCeilings {
    uint64_t address_space_bytes = 0;  // RLIMIT_AS
    uint64_t cpu_seconds = 0;          // RLIMIT_CPU
    uint64_t open_files = 0;           // RLIMIT_NOFILE
    uint64_t file_size_bytes = 0;      // RLIMIT_FSIZE

    bool any() const {
        return address_space_bytes || cpu_seconds || open_files || file_size_bytes;
    }
};

struct ProcessSpec {
    std::vector<std::string> argv;          // argv[0] is looked up on PATH
    std::string working_dir;                // empty = inherit
    std::vector<std::pair<std::string, std::string>> env;  // added/overridden variables
    bool clear_environment = false;         // start from PATH, LANG and HOME only
    ResourceCeilings limits;
    bool isolate_network = false;           // private network namespace, best effort
    size_t max_output_bytes = 1024 * 1024;  // per stream
};

struct ProcessOutcome {
    bool launched = false;
    std::string launch_error;

    bool timed_out = false;
    bool force_killed = false;   // needed SIGKILL after the grace period
    int exit_code = -1;          // 128+N when killed by signal N, -1 on timeout
    int term_signal = 0;

    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool rlimits_applied = false;
    bool network_isolated = false;

    std::chrono::milliseconds elapsed{0};

    bool truncated() const { return stdout_truncated || stderr_truncated; }
};

class ChildProcess {
public:
    // Runs in the parent after the child is set up but before it execs
    using SpawnHook = std::function<void(pid_t)>;

    explicit ChildProcess(ProcessSpec spec);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // false = launch failure, see outcome().launch_error
    bool spawn(const SpawnHook& on_spawned = {});

    // Capture output until the child exits or timeout elapses.
    // On timeout the group gets SIGTERM, then SIGKILL after grace.
    const ProcessOutcome& communicate(std::chrono::milliseconds timeout,
                                      std::chrono::milliseconds grace);

    // SIGTERM -> wait up to grace -> SIGKILL, on the whole process group
    bool terminate(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !reaped_; }
    const ProcessOutcome& outcome() const { return outcome_; }

private:
    ProcessSpec spec_;
    ProcessOutcome outcome_;
    pid_t pid_ = -1;
    bool reaped_ = false;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::chrono::steady_clock::time_point started_;

    bool leader_exited();
    void reap(bool blocking);
    void read_available(int& fd, std::string& buffer, bool& truncated);
    void drain(std::chrono::milliseconds budget);
    void close_fds();
    void fail_launch(const std::string& message);
};

ProcessOutcome run_process(const ProcessSpec& spec,
                           std::chrono::milliseconds timeout,
                           std::chrono::milliseconds grace,
                           const ChildProcess::SpawnHook& on_spawned = {});

// Absolute path of an executable, searching PATH for bare names. Empty when not found.
std::string resolve_executable(const std::string& name);

} // namespace runbox::runtime
