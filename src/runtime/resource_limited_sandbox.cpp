#include "runtime/resource_limited_sandbox.hpp"
#include "runtime/cgroup.hpp"
#include "util/config.hpp"
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace runbox::runtime {

ResourceLimitedSandbox::ResourceLimitedSandbox(SandboxConfig config,
                                               std::shared_ptr<const LanguageTable> languages,
                                               std::shared_ptr<const security::SafetyPolicy> policy,
                                               uint64_t pids_limit)
    : IsolationBackend(config, languages),
      runner_(config, languages, false),
      policy_(std::move(policy)),
      pids_limit_(pids_limit) {
    if (!policy_) {
        throw std::invalid_argument("resource-limited sandbox needs a safety policy");
    }
    spdlog::info("Resource-limited sandbox ready (timeout={}, memory={}, screen={})",
                 format_timeout(config_.timeout),
                 util::format_memory_size(config_.memory_limit_bytes),
                 config_.security_screen_enabled ? policy_->name() : "off");
}

BackendAvailability ResourceLimitedSandbox::probe() const {
    BackendAvailability availability = runner_.probe();
    availability.backend = name();

    std::string cgroup_detail;
    if (availability.available && !CgroupScope::available(&cgroup_detail)) {
        availability.detail += availability.detail.empty() ? "" : "; ";
        availability.detail += "rlimits only: " + cgroup_detail;
    }
    return availability;
}

nlohmann::json ResourceLimitedSandbox::describe() const {
    nlohmann::json j = IsolationBackend::describe();
    j["policy"] = config_.security_screen_enabled ? policy_->describe() : nlohmann::json(nullptr);
    j["limits"] = {
        {"open_files", OPEN_FILES_LIMIT},
        {"file_size", util::format_memory_size(FILE_SIZE_LIMIT)},
        {"pids", pids_limit_},
    };
    std::string detail;
    j["cgroup"] = CgroupScope::available(&detail) ? "available" : detail;
    return j;
}

void ResourceLimitedSandbox::run(const ExecutionContext& ctx, ExecutionResult& result) {
    if (config_.security_screen_enabled) {
        security::Verdict verdict = policy_->check(ctx.request.code(), ctx.profile.language);
        if (!verdict.allowed) {
            spdlog::warn("Security check failed for {}: {} (code: {})", ctx.profile.language,
                         verdict.reason, code_preview(ctx.request.code()));
            result.fail(ErrorKind::VALIDATION, "Security check failed: " + verdict.reason);
            return;
        }
    }

    const auto seconds = (ctx.config.timeout.count() + 999) / 1000;

    LaunchOptions options;
    options.limits.address_space_bytes = ctx.config.memory_limit_bytes;
    options.limits.cpu_seconds = static_cast<uint64_t>(seconds);
    options.limits.open_files = OPEN_FILES_LIMIT;
    options.limits.file_size_bytes = FILE_SIZE_LIMIT;
    options.clear_environment = true;
    options.isolate_network = !ctx.config.network_enabled;

    CgroupScope cgroup("exec-" + ctx.execution_id,
                       CgroupLimits{ctx.config.memory_limit_bytes, pids_limit_});
    bool cgroup_ready = cgroup.create();
    bool cgroup_attached = false;
    if (cgroup_ready) {
        options.on_spawned = [&](pid_t pid) { cgroup_attached = cgroup.attach(pid); };
    }

    LaunchReport report = runner_.launch(ctx, options, result);
    if (!report.launched) {
        return;
    }

    IsolationStatus status;
    status.rlimits_applied = report.rlimits_applied;
    status.cgroup_applied = cgroup_ready && cgroup_attached;
    status.network_namespace = report.network_isolated;

    std::string reasons;
    auto add_reason = [&](const std::string& reason) {
        if (!reasons.empty()) reasons += "; ";
        reasons += reason;
    };
    if (!status.rlimits_applied) add_reason("rlimits not applied");
    if (!status.cgroup_applied) add_reason(cgroup.degraded_reason().empty() ? "no cgroup" : cgroup.degraded_reason());
    if (options.isolate_network && !status.network_namespace) add_reason("network namespace unavailable");
    status.degraded_reason = reasons;

    result.isolation = status;
}

} // namespace runbox::runtime
