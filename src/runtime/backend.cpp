#include "runtime/backend.hpp"
#include "util/config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#include <stdexcept>

namespace runbox::runtime {

// ============================================================================
// SandboxConfig / BackendAvailability
// ============================================================================

SandboxConfig SandboxConfig::merged(const ExecutionOptions& options) const {
    SandboxConfig effective = *this;
    if (options.timeout) effective.timeout = *options.timeout;
    if (options.memory_limit_bytes) effective.memory_limit_bytes = *options.memory_limit_bytes;
    if (options.network_enabled) effective.network_enabled = *options.network_enabled;
    return effective;
}

nlohmann::json SandboxConfig::to_json() const {
    nlohmann::json j;
    j["timeout"] = static_cast<double>(timeout.count()) / 1000.0;
    j["memory_limit"] = util::format_memory_size(memory_limit_bytes);
    j["network_enabled"] = network_enabled;
    j["security_screen_enabled"] = security_screen_enabled;
    j["kill_grace_ms"] = kill_grace.count();
    j["max_output_bytes"] = max_output_bytes;
    return j;
}

nlohmann::json BackendAvailability::to_json() const {
    nlohmann::json j;
    j["backend"] = backend;
    j["available"] = available;
    if (!detail.empty()) {
        j["detail"] = detail;
    }
    return j;
}

std::string format_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return fmt::format("{}s", timeout.count() / 1000);
    }
    return fmt::format("{:.1f}s", static_cast<double>(timeout.count()) / 1000.0);
}

// ============================================================================
// IsolationBackend
// ============================================================================

IsolationBackend::IsolationBackend(SandboxConfig config, std::shared_ptr<const LanguageTable> languages)
    : config_(config), languages_(std::move(languages)) {
    if (!languages_) {
        throw std::invalid_argument("isolation backend needs a language table");
    }
}

ExecutionResult IsolationBackend::execute(const std::string& code, const std::string& language) {
    return execute(ExecutionRequest(code, language));
}

ExecutionResult IsolationBackend::execute(const ExecutionRequest& request) {
    const auto started = std::chrono::steady_clock::now();

    ExecutionResult result;
    result.backend = name();
    result.language = request.language();
    result.execution_id = make_execution_id();

    const LanguageProfile* profile = languages_->resolve(request.language());
    if (!profile) {
        result.fail(ErrorKind::UNSUPPORTED_LANGUAGE,
                    fmt::format("Unsupported language: {} (supported: {})", request.language(),
                                fmt::join(languages_->languages(), ", ")));
        spdlog::warn("[{}] {}", name(), result.error->message);
        return result;
    }
    result.language = profile->language;

    ExecutionContext ctx{request, *profile, config_.merged(request.options()), result.execution_id};

    try {
        run(ctx, result);
    } catch (const std::exception& e) {
        result.fail(ErrorKind::INTERNAL, fmt::format("Internal error: {}", e.what()));
    }

    // success implies a zero exit code and no error
    result.success = result.success && result.exit_code == 0 && !result.error;
    result.execution_time = std::chrono::steady_clock::now() - started;

    if (result.success) {
        spdlog::info("[{}] {} finished in {:.3f}s (exit=0)", name(), result.language,
                     result.execution_time.count());
    } else {
        spdlog::warn("[{}] {} failed in {:.3f}s (exit={}, kind={})", name(), result.language,
                     result.execution_time.count(), result.exit_code,
                     error_kind_to_string(result.error_kind()));
    }
    return result;
}

nlohmann::json IsolationBackend::describe() const {
    nlohmann::json j = config_.to_json();
    j["backend"] = name();
    j["languages"] = languages_->languages();
    return j;
}

} // namespace runbox::runtime
