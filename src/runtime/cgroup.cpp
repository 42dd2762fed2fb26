#include "runtime/cgroup.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace runbox::runtime {

namespace {

bool write_control(const std::string& file, const std::string& value) {
    std::ofstream ofs(file);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << value;
    ofs.flush();
    return ofs.good();
}

} // namespace

CgroupScope::CgroupScope(std::string name, CgroupLimits limits, std::string root)
    : root_(std::move(root)), limits_(limits) {
    path_ = root_ + "/" + name;
}

CgroupScope::~CgroupScope() {
    destroy();
}

bool CgroupScope::available(std::string* detail) {
    std::error_code ec;
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers", ec)) {
        if (detail) *detail = "cgroup v2 not available";
        return false;
    }
    if (access("/sys/fs/cgroup", W_OK) != 0 && access(default_root().c_str(), W_OK) != 0) {
        if (detail) *detail = "cgroup hierarchy not writable (need root or delegation)";
        return false;
    }
    return true;
}

bool CgroupScope::init_root() {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        fs::create_directories(root_, ec);
        if (ec) {
            degraded_reason_ = "cannot create cgroup root " + root_ + ": " + ec.message();
            return false;
        }
    }

    // Controllers must be enabled in the parent for children to get memory.max / pids.max.
    // Writing them again is harmless; failure means they are already on or not delegated.
    std::string parent = fs::path(root_).parent_path().string();
    write_control(parent + "/cgroup.subtree_control", "+memory +pids");
    write_control(root_ + "/cgroup.subtree_control", "+memory +pids");
    return true;
}

bool CgroupScope::create() {
    std::error_code ec;
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers", ec)) {
        degraded_reason_ = "cgroup v2 not available";
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - memory/pids limits rely on rlimits only");
        return false;
    }

    if (!init_root()) {
        spdlog::warn("DEGRADED ISOLATION: {}", degraded_reason_);
        return false;
    }

    fs::create_directory(path_, ec);
    if (ec) {
        degraded_reason_ = "cannot create cgroup " + path_ + ": " + ec.message();
        spdlog::warn("DEGRADED ISOLATION: {}", degraded_reason_);
        return false;
    }
    created_ = true;

    bool memory_ok = true;
    if (limits_.memory_max_bytes > 0) {
        memory_ok = write_control(path_ + "/memory.max", std::to_string(limits_.memory_max_bytes));
        // No swap so the memory ceiling is a real ceiling
        write_control(path_ + "/memory.swap.max", "0");
        if (!memory_ok) {
            spdlog::warn("DEGRADED ISOLATION: memory.max not writable in {}", path_);
        } else {
            spdlog::debug("Set cgroup memory.max: {} bytes", limits_.memory_max_bytes);
        }
    }

    bool pids_ok = true;
    if (limits_.pids_max > 0) {
        pids_ok = write_control(path_ + "/pids.max", std::to_string(limits_.pids_max));
        if (!pids_ok) {
            spdlog::warn("DEGRADED ISOLATION: pids.max not writable in {}", path_);
        } else {
            spdlog::debug("Set cgroup pids.max: {}", limits_.pids_max);
        }
    }

    limits_applied_ = memory_ok && pids_ok;
    if (!limits_applied_) {
        degraded_reason_ = "cgroup controllers not delegated (memory=" +
                           std::string(memory_ok ? "ON" : "OFF") + ", pids=" +
                           std::string(pids_ok ? "ON" : "OFF") + ")";
    }
    return limits_applied_;
}

bool CgroupScope::attach(pid_t pid) {
    if (!created_) {
        return false;
    }
    if (!write_control(path_ + "/cgroup.procs", std::to_string(pid))) {
        degraded_reason_ = "failed to add process to cgroup";
        limits_applied_ = false;
        spdlog::warn("DEGRADED ISOLATION: Process {} not added to cgroup {} - limits NOT enforced",
                     pid, path_);
        return false;
    }
    spdlog::debug("Added PID {} to cgroup {}", pid, path_);
    return true;
}

void CgroupScope::destroy() {
    if (!created_) {
        return;
    }
    created_ = false;

    // cgroup.kill exists from Linux 5.14; older kernels rely on the caller's group kill
    std::error_code ec;
    if (fs::exists(path_ + "/cgroup.kill", ec)) {
        write_control(path_ + "/cgroup.kill", "1");
    }

    // rmdir fails with EBUSY until the last member has been reaped
    for (int attempt = 0; attempt < 20; attempt++) {
        if (rmdir(path_.c_str()) == 0 || errno == ENOENT) {
            spdlog::debug("Cleaned up cgroup: {}", path_);
            return;
        }
        if (errno != EBUSY) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::warn("Failed to cleanup cgroup {}: {}", path_, strerror(errno));
}

} // namespace runbox::runtime
