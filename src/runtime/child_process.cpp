#include "runtime/child_process.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace runbox::runtime {

namespace {

// Child -> parent status record, written to the report pipe
struct ChildReport {
    char tag;        // 'R' ready, 'S' setup failed, 'E' exec failed
    int error;       // errno for 'S'/'E'
    int flags;       // REPORT_* bits for 'R'
};

constexpr int REPORT_NETNS = 1;
constexpr int REPORT_RLIMITS = 2;

constexpr char DEFAULT_PATH[] = "/usr/local/bin:/usr/bin:/bin";

struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
    ~Pipe() { close_read(); close_write(); }
};

bool write_all(int fd, const void* data, size_t size) {
    const char* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

// 0 = EOF, 1 = got a full record, -1 = error
int read_report(int fd, ChildReport* report) {
    size_t got = 0;
    char* p = reinterpret_cast<char*>(report);
    while (got < sizeof(ChildReport)) {
        ssize_t n = ::read(fd, p + got, sizeof(ChildReport) - got);
        if (n < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (n == 0) {
            return got == 0 ? 0 : -1;
        }
        got += static_cast<size_t>(n);
    }
    return 1;
}

// Never raises a limit above the inherited hard limit
bool lower_limit(int resource, uint64_t value, uint64_t hard_extra = 0) {
    struct rlimit current;
    if (getrlimit(resource, &current) != 0) {
        return false;
    }
    rlim_t soft = static_cast<rlim_t>(value);
    rlim_t hard = static_cast<rlim_t>(value + hard_extra);
    if (current.rlim_max != RLIM_INFINITY) {
        soft = std::min(soft, current.rlim_max);
        hard = std::min(hard, current.rlim_max);
    }
    struct rlimit wanted = {soft, hard};
    return setrlimit(resource, &wanted) == 0;
}

// Failure leaves the user namespace unmapped; exec still runs with the original credentials
bool write_file_in_child(const char* path, const char* data, size_t size) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = write_all(fd, data, size);
    ::close(fd);
    return ok;
}

std::vector<std::string> build_environment(const ProcessSpec& spec) {
    std::vector<std::string> env;
    if (spec.clear_environment) {
        const char* path = std::getenv("PATH");
        env.push_back(std::string("PATH=") + (path ? path : DEFAULT_PATH));
        env.push_back("LANG=C.UTF-8");
        env.push_back("HOME=" + (spec.working_dir.empty() ? std::string("/tmp") : spec.working_dir));
    } else {
        for (char** e = environ; e && *e; ++e) {
            env.emplace_back(*e);
        }
    }

    for (const auto& [key, value] : spec.env) {
        std::string prefix = key + "=";
        env.erase(std::remove_if(env.begin(), env.end(),
                                 [&](const std::string& entry) { return entry.rfind(prefix, 0) == 0; }),
                  env.end());
        env.push_back(prefix + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

std::string resolve_executable(const std::string& name) {
    if (name.empty()) {
        return "";
    }

    auto executable = [](const std::string& path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return executable(name) ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : DEFAULT_PATH;

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        if (executable(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return "";
}

// ============================================================================
// ChildProcess Implementation
// ============================================================================

ChildProcess::ChildProcess(ProcessSpec spec)
    : spec_(std::move(spec)) {}

ChildProcess::~ChildProcess() {
    if (running()) {
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
        reap(true);
    }
    close_fds();
}

void ChildProcess::fail_launch(const std::string& message) {
    outcome_.launched = false;
    outcome_.launch_error = message;
    spdlog::debug("Launch failed: {}", message);
}

bool ChildProcess::spawn(const SpawnHook& on_spawned) {
    if (pid_ > 0) {
        fail_launch("process already spawned");
        return false;
    }
    if (spec_.argv.empty()) {
        fail_launch("empty command");
        return false;
    }

    std::string exe = resolve_executable(spec_.argv[0]);
    if (exe.empty()) {
        fail_launch("executable not found: " + spec_.argv[0]);
        return false;
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argv_strings = spec_.argv;
    std::vector<std::string> env_strings = build_environment(spec_);
    std::vector<char*> argv = to_c_array(argv_strings);
    std::vector<char*> envp = to_c_array(env_strings);

    const std::string uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
    const std::string gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";
    const char* workdir = spec_.working_dir.empty() ? nullptr : spec_.working_dir.c_str();

    Pipe out_pipe, err_pipe, sync_pipe, report_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !sync_pipe.open() || !report_pipe.open()) {
        fail_launch(std::string("pipe failed: ") + strerror(errno));
        return false;
    }

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        fail_launch(std::string("cannot open /dev/null: ") + strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        ::close(devnull);
        fail_launch(std::string("fork failed: ") + strerror(errno));
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here to exec
        signal(SIGPIPE, SIG_DFL);
        setpgid(0, 0);

        dup2(devnull, STDIN_FILENO);
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);

        ChildReport report = {'R', 0, 0};

        if (spec_.isolate_network) {
            if (unshare(CLONE_NEWNET) == 0) {
                report.flags |= REPORT_NETNS;
            } else if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
                if (write_file_in_child("/proc/self/setgroups", "deny", 4)) {
                    write_file_in_child("/proc/self/uid_map", uid_map.data(), uid_map.size());
                    write_file_in_child("/proc/self/gid_map", gid_map.data(), gid_map.size());
                }
                report.flags |= REPORT_NETNS;
            }
        }

        const ResourceCeilings& limits = spec_.limits;
        bool limits_ok = true;
        if (limits.address_space_bytes) limits_ok &= lower_limit(RLIMIT_AS, limits.address_space_bytes);
        if (limits.cpu_seconds) limits_ok &= lower_limit(RLIMIT_CPU, limits.cpu_seconds, 1);
        if (limits.open_files) limits_ok &= lower_limit(RLIMIT_NOFILE, limits.open_files);
        if (limits.file_size_bytes) limits_ok &= lower_limit(RLIMIT_FSIZE, limits.file_size_bytes);
        if (limits.any() && limits_ok) report.flags |= REPORT_RLIMITS;

        if (workdir && chdir(workdir) != 0) {
            ChildReport failed = {'S', errno, 0};
            write_all(report_pipe.fds[1], &failed, sizeof(failed));
            _exit(126);
        }

        write_all(report_pipe.fds[1], &report, sizeof(report));

        // Wait for the parent to finish placing us (cgroup) before exec
        char go = 0;
        ssize_t n;
        do {
            n = ::read(sync_pipe.fds[0], &go, 1);
        } while (n < 0 && errno == EINTR);
        if (n != 1) {
            _exit(126);
        }

        execve(exe.c_str(), argv.data(), envp.data());

        ChildReport failed = {'E', errno, 0};
        write_all(report_pipe.fds[1], &failed, sizeof(failed));
        _exit(127);
    }

    // Parent
    pid_ = pid;
    ::close(devnull);
    out_pipe.close_write();
    err_pipe.close_write();
    sync_pipe.close_read();
    report_pipe.close_write();

    // Also set from the parent so a group kill works even before the child runs
    setpgid(pid_, pid_);

    ChildReport report = {};
    int got = read_report(report_pipe.fds[0], &report);
    if (got != 1 || report.tag != 'R') {
        std::string message = (got == 1 && report.tag == 'S')
            ? "cannot enter working directory " + spec_.working_dir + ": " + strerror(report.error)
            : "child exited during setup";
        sync_pipe.close_write();
        kill(pid_, SIGKILL);
        reap(true);
        fail_launch(message);
        return false;
    }

    outcome_.network_isolated = (report.flags & REPORT_NETNS) != 0;
    outcome_.rlimits_applied = (report.flags & REPORT_RLIMITS) != 0;
    if (spec_.isolate_network && !outcome_.network_isolated) {
        spdlog::warn("DEGRADED ISOLATION: could not create a network namespace for PID {}", pid_);
    }

    if (on_spawned) {
        on_spawned(pid_);
    }

    started_ = std::chrono::steady_clock::now();
    if (!write_all(sync_pipe.fds[1], "x", 1)) {
        kill(pid_, SIGKILL);
        reap(true);
        fail_launch(std::string("cannot release child: ") + strerror(errno));
        return false;
    }
    sync_pipe.close_write();

    // EOF = exec succeeded (the report pipe is CLOEXEC)
    got = read_report(report_pipe.fds[0], &report);
    if (got == 1 && report.tag == 'E') {
        reap(true);
        fail_launch("exec " + exe + " failed: " + strerror(report.error));
        return false;
    }

    stdout_fd_ = out_pipe.fds[0];
    stderr_fd_ = err_pipe.fds[0];
    out_pipe.fds[0] = -1;
    err_pipe.fds[0] = -1;
    fcntl(stdout_fd_, F_SETFL, fcntl(stdout_fd_, F_GETFL) | O_NONBLOCK);
    fcntl(stderr_fd_, F_SETFL, fcntl(stderr_fd_, F_GETFL) | O_NONBLOCK);

    outcome_.launched = true;
    spdlog::debug("Spawned {} (PID={})", spec_.argv[0], pid_);
    return true;
}

bool ChildProcess::leader_exited() {
    if (reaped_) {
        return true;
    }
    // WNOWAIT keeps the zombie, so the process group id cannot be reused yet
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid_;
}

void ChildProcess::reap(bool blocking) {
    if (reaped_ || pid_ <= 0) {
        return;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, blocking ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            outcome_.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome_.term_signal = WTERMSIG(status);
            outcome_.exit_code = 128 + outcome_.term_signal;
        }
    } else if (result < 0) {
        // ECHILD: somebody else reaped it
        reaped_ = true;
    }
}

void ChildProcess::read_available(int& fd, std::string& buffer, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char chunk[8192];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            size_t room = spec_.max_output_bytes > buffer.size() ? spec_.max_output_bytes - buffer.size() : 0;
            size_t keep = std::min(room, static_cast<size_t>(n));
            buffer.append(chunk, keep);
            if (keep < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EOF or hard error
        ::close(fd);
        fd = -1;
        return;
    }
}

void ChildProcess::drain(std::chrono::milliseconds budget) {
    auto until = std::chrono::steady_clock::now() + budget;
    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            until - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (stdout_fd_ >= 0) fds[count++] = {stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) fds[count++] = {stderr_fd_, POLLIN, 0};
        int ready = poll(fds, count, static_cast<int>(std::min<int64_t>(remaining.count(), 20)));
        if (ready < 0 && errno != EINTR) {
            break;
        }
        read_available(stdout_fd_, outcome_.stdout_text, outcome_.stdout_truncated);
        read_available(stderr_fd_, outcome_.stderr_text, outcome_.stderr_truncated);
    }
    close_fds();
}

const ProcessOutcome& ChildProcess::communicate(std::chrono::milliseconds timeout,
                                                std::chrono::milliseconds grace) {
    if (!outcome_.launched || reaped_) {
        return outcome_;
    }

    const auto deadline = started_ + timeout;

    while (true) {
        if (leader_exited()) {
            // Stragglers in the group would hold the pipes open
            kill(-pid_, SIGKILL);
            reap(true);
            drain(std::chrono::milliseconds(200));
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome_.timed_out = true;
            spdlog::debug("PID {} exceeded {}ms, terminating", pid_, timeout.count());
            terminate(grace);
            drain(std::chrono::milliseconds(200));
            outcome_.exit_code = -1;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<int64_t>(std::max<int64_t>(remaining.count(), 1), 20));

        struct pollfd fds[2];
        nfds_t count = 0;
        if (stdout_fd_ >= 0) fds[count++] = {stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) fds[count++] = {stderr_fd_, POLLIN, 0};

        if (count == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        } else if (poll(fds, count, wait_ms) < 0 && errno != EINTR) {
            spdlog::warn("poll failed for PID {}: {}", pid_, strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        }

        read_available(stdout_fd_, outcome_.stdout_text, outcome_.stdout_truncated);
        read_available(stderr_fd_, outcome_.stderr_text, outcome_.stderr_truncated);
    }

    outcome_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    return outcome_;
}

bool ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!running()) {
        return true;
    }

    if (kill(-pid_, SIGTERM) < 0 && errno == ESRCH) {
        kill(pid_, SIGTERM);
    }

    auto until = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < until) {
        if (leader_exited()) {
            kill(-pid_, SIGKILL);
            reap(true);
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    spdlog::warn("PID {} not responding to SIGTERM, sending SIGKILL", pid_);
    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
    reap(true);
    outcome_.force_killed = true;
    return false;
}

void ChildProcess::close_fds() {
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

ProcessOutcome run_process(const ProcessSpec& spec,
                           std::chrono::milliseconds timeout,
                           std::chrono::milliseconds grace,
                           const ChildProcess::SpawnHook& on_spawned) {
    ChildProcess child(spec);
    if (!child.spawn(on_spawned)) {
        return child.outcome();
    }
    return child.communicate(timeout, grace);
}

} // namespace runbox::runtime
