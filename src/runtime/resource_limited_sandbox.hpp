/**
 * Process sandbox behind a safety screen and resource ceilings.
 *
 * Validation is a strict gate: rejected code never reaches fork(). Memory,
 * CPU time, open files and file size are capped with rlimits, and with a
 * per-call cgroup where the hierarchy is writable.
 */
#pragma once
#include <memory>

#include "runtime/backend.hpp"
#include "runtime/process_sandbox.hpp"
#include "security/safety_policy.hpp"

namespace runbox::runtime {

class ResourceLimitedSandbox : public IsolationBackend {
public:
    static constexpr uint64_t OPEN_FILES_LIMIT = 64;
    static constexpr uint64_t FILE_SIZE_LIMIT = 16ULL * 1024 * 1024;

    ResourceLimitedSandbox(SandboxConfig config,
                           std::shared_ptr<const LanguageTable> languages,
                           std::shared_ptr<const security::SafetyPolicy> policy,
                           uint64_t pids_limit = 64);

    std::string name() const override { return "resource_limited"; }
    BackendAvailability probe() const override;
    nlohmann::json describe() const override;

    const security::SafetyPolicy& policy() const { return *policy_; }

protected:
    void run(const ExecutionContext& ctx, ExecutionResult& result) override;

private:
    ProcessSandbox runner_;
    std::shared_ptr<const security::SafetyPolicy> policy_;
    uint64_t pids_limit_;
};

} // namespace runbox::runtime
