/**
 * SandboxManager: facade over the registered isolation backends.
 *
 * Routes requests by backend name, reports availability, and runs the same
 * code across backends for comparison or benchmarking. Backend problems
 * (unknown name, engine down, stray exception) come back as results, never
 * as exceptions, so iterating over every backend cannot abort half-way.
 */
#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "runtime/backend.hpp"
#include "util/config.hpp"

namespace runbox::runtime {

struct BenchmarkStats {
    std::string backend;
    int runs = 0;
    int successes = 0;
    double min_seconds = 0.0;
    double max_seconds = 0.0;
    double mean_seconds = 0.0;
    std::string error;      // first failure, if any

    nlohmann::json to_json() const;
};

class SandboxManager {
public:
    static constexpr const char* DEFAULT_BACKEND = "resource_limited";

    explicit SandboxManager(std::shared_ptr<const LanguageTable> languages);

    // process + resource_limited + container (docker CLI), configured from settings
    static std::unique_ptr<SandboxManager> create_default(const util::Settings& settings);

    // Registration happens before any execute(); the set is fixed afterwards
    void add_backend(std::unique_ptr<IsolationBackend> backend);

    ExecutionResult execute(const std::string& code, const std::string& language,
                            const std::string& backend = DEFAULT_BACKEND,
                            const ExecutionOptions& options = {});
    ExecutionResult execute(const ExecutionRequest& request, const std::string& backend);

    // Same code on every registered backend, one after another
    std::map<std::string, ExecutionResult> compare(const std::string& code, const std::string& language,
                                                   const ExecutionOptions& options = {});

    // Probes every backend now
    std::map<std::string, BackendAvailability> availability();

    std::map<std::string, BenchmarkStats> benchmark(const std::string& code, const std::string& language,
                                                    int runs = 3);

    // describe() of a backend plus its last known availability; null when unknown
    nlohmann::json info(const std::string& backend) const;

    std::vector<std::string> backend_names() const;
    IsolationBackend* backend(const std::string& name) const;
    const LanguageTable& languages() const { return *languages_; }

    // "simple" -> "process", "safe" -> "resource_limited", "docker" -> "container"
    static std::string canonical_name(const std::string& name);

private:
    std::shared_ptr<const LanguageTable> languages_;
    std::vector<std::unique_ptr<IsolationBackend>> backends_;

    mutable std::mutex availability_mutex_;
    std::map<std::string, BackendAvailability> availability_cache_;

    BackendAvailability check_available(IsolationBackend& backend);
    void remember(const BackendAvailability& availability);
};

} // namespace runbox::runtime
