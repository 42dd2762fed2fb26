/**
 * Per-execution cgroup v2 scope under /sys/fs/cgroup/runbox/<id>.
 *
 * Requires a writable cgroup v2 hierarchy (root or a delegated subtree).
 * Without one every call degrades to rlimits only, with a warning.
 */
#pragma once
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace runbox::runtime {

struct CgroupLimits {
    uint64_t memory_max_bytes = 0;   // 0 = leave unset
    uint64_t pids_max = 0;
};

class CgroupScope {
public:
    CgroupScope(std::string name, CgroupLimits limits, std::string root = default_root());
    ~CgroupScope();

    CgroupScope(const CgroupScope&) = delete;
    CgroupScope& operator=(const CgroupScope&) = delete;

    // Create the cgroup and write limits. false = degraded (see degraded_reason())
    bool create();

    // Move pid into the cgroup
    bool attach(pid_t pid);

    // Kill everything left inside and remove the directory
    void destroy();

    bool active() const { return created_ && limits_applied_; }
    const std::string& path() const { return path_; }
    const std::string& degraded_reason() const { return degraded_reason_; }

    static std::string default_root() { return "/sys/fs/cgroup/runbox"; }

    // cgroup v2 mounted and our root creatable
    static bool available(std::string* detail = nullptr);

private:
    std::string root_;
    std::string path_;
    CgroupLimits limits_;
    bool created_ = false;
    bool limits_applied_ = false;
    std::string degraded_reason_;

    bool init_root();
};

} // namespace runbox::runtime
