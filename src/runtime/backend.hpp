/**
 * IsolationBackend: one strategy for running untrusted code.
 *
 * execute() is the template method every backend shares: it resolves the
 * language, stamps id/backend/timing onto the result, converts stray
 * exceptions, and logs the outcome. Subclasses implement run().
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "runtime/execution.hpp"
#include "runtime/language_profile.hpp"

namespace runbox::runtime {

// One instance per backend; never mutated by a call
struct SandboxConfig {
    std::chrono::milliseconds timeout{10000};
    uint64_t memory_limit_bytes = 128ULL * 1024 * 1024;
    bool network_enabled = false;
    bool security_screen_enabled = false;
    std::chrono::milliseconds kill_grace{1000};
    size_t max_output_bytes = 1024 * 1024;

    // Copy with the request's overrides applied
    SandboxConfig merged(const ExecutionOptions& options) const;

    nlohmann::json to_json() const;
};

struct BackendAvailability {
    std::string backend;
    bool available = false;
    std::string detail;

    nlohmann::json to_json() const;
};

// Everything run() needs for one call
struct ExecutionContext {
    const ExecutionRequest& request;
    const LanguageProfile& profile;
    SandboxConfig config;      // effective (overrides applied)
    std::string execution_id;
};

class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    IsolationBackend(const IsolationBackend&) = delete;
    IsolationBackend& operator=(const IsolationBackend&) = delete;

    virtual std::string name() const = 0;

    // Never throws; every failure is reported in the result
    ExecutionResult execute(const ExecutionRequest& request);
    ExecutionResult execute(const std::string& code, const std::string& language);

    virtual BackendAvailability probe() const = 0;

    virtual nlohmann::json describe() const;

    const SandboxConfig& config() const { return config_; }
    const LanguageTable& languages() const { return *languages_; }

protected:
    IsolationBackend(SandboxConfig config, std::shared_ptr<const LanguageTable> languages);

    // Fill result (output, exit code, success, error). Timing and identity are set by execute().
    virtual void run(const ExecutionContext& ctx, ExecutionResult& result) = 0;

    SandboxConfig config_;
    std::shared_ptr<const LanguageTable> languages_;
};

std::string format_timeout(std::chrono::milliseconds timeout);

} // namespace runbox::runtime
