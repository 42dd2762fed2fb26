#include "runtime/sandbox_manager.hpp"
#include "runtime/container_engine.hpp"
#include "runtime/container_sandbox.hpp"
#include "runtime/process_sandbox.hpp"
#include "runtime/resource_limited_sandbox.hpp"
#include "security/safety_policy.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace runbox::runtime {

namespace {

ExecutionResult unavailable_result(const std::string& backend, const std::string& language,
                                   const std::string& message) {
    ExecutionResult result;
    result.backend = backend;
    result.language = language;
    result.fail(ErrorKind::BACKEND_UNAVAILABLE, message);
    return result;
}

} // namespace

nlohmann::json BenchmarkStats::to_json() const {
    nlohmann::json j;
    j["backend"] = backend;
    j["runs"] = runs;
    j["successes"] = successes;
    j["min"] = min_seconds;
    j["max"] = max_seconds;
    j["mean"] = mean_seconds;
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

SandboxManager::SandboxManager(std::shared_ptr<const LanguageTable> languages)
    : languages_(std::move(languages)) {
    if (!languages_) {
        throw std::invalid_argument("sandbox manager needs a language table");
    }
}

std::unique_ptr<SandboxManager> SandboxManager::create_default(const util::Settings& settings) {
    LanguageTable table = LanguageTable::default_table();
    if (!settings.languages_file.empty()) {
        std::string error;
        LanguageTable loaded;
        if (LanguageTable::load_file(settings.languages_file, &loaded, &error)) {
            table = std::move(loaded);
        } else {
            spdlog::error("Cannot load language profiles ({}), using built-in table", error);
        }
    }
    auto languages = std::make_shared<const LanguageTable>(std::move(table));
    auto manager = std::make_unique<SandboxManager>(languages);

    SandboxConfig base;
    base.network_enabled = settings.network_enabled;
    base.kill_grace = settings.kill_grace;
    base.max_output_bytes = settings.max_output_bytes;

    SandboxConfig process_config = base;
    process_config.timeout = settings.process_timeout;
    process_config.memory_limit_bytes = settings.memory_limit_bytes;
    manager->add_backend(std::make_unique<ProcessSandbox>(process_config, languages));

    SandboxConfig limited_config = base;
    limited_config.timeout = settings.resource_limited_timeout;
    limited_config.memory_limit_bytes = settings.memory_limit_bytes;
    limited_config.security_screen_enabled = settings.security_screen_enabled;
    manager->add_backend(std::make_unique<ResourceLimitedSandbox>(
        limited_config, languages, security::make_safety_policy(settings.security_screen_enabled),
        static_cast<uint64_t>(settings.container_pids_limit)));

    SandboxConfig container_config = base;
    container_config.timeout = settings.container_timeout;
    container_config.memory_limit_bytes = settings.container_memory_limit_bytes;

    ContainerSettings container_settings;
    container_settings.user = settings.container_user;
    container_settings.pids_limit = settings.container_pids_limit;

    manager->add_backend(std::make_unique<ContainerSandbox>(
        container_config, languages, std::make_shared<DockerCliEngine>(settings.docker_binary),
        container_settings));

    return manager;
}

void SandboxManager::add_backend(std::unique_ptr<IsolationBackend> backend) {
    if (!backend) {
        throw std::invalid_argument("null backend");
    }
    std::string name = backend->name();
    auto existing = std::find_if(backends_.begin(), backends_.end(),
                                 [&](const auto& b) { return b->name() == name; });
    if (existing != backends_.end()) {
        spdlog::warn("Replacing backend {}", name);
        *existing = std::move(backend);
    } else {
        backends_.push_back(std::move(backend));
    }

    std::lock_guard<std::mutex> lock(availability_mutex_);
    availability_cache_.erase(name);
}

std::string SandboxManager::canonical_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "simple") return "process";
    if (lower == "safe") return "resource_limited";
    if (lower == "docker") return "container";
    return lower;
}

IsolationBackend* SandboxManager::backend(const std::string& name) const {
    std::string canonical = canonical_name(name);
    for (const auto& b : backends_) {
        if (b->name() == canonical) {
            return b.get();
        }
    }
    return nullptr;
}

std::vector<std::string> SandboxManager::backend_names() const {
    std::vector<std::string> names;
    for (const auto& b : backends_) {
        names.push_back(b->name());
    }
    return names;
}

void SandboxManager::remember(const BackendAvailability& availability) {
    std::lock_guard<std::mutex> lock(availability_mutex_);
    availability_cache_[availability.backend] = availability;
}

BackendAvailability SandboxManager::check_available(IsolationBackend& backend) {
    {
        std::lock_guard<std::mutex> lock(availability_mutex_);
        auto it = availability_cache_.find(backend.name());
        if (it != availability_cache_.end() && it->second.available) {
            return it->second;
        }
    }

    // Unknown or previously down: probe again so a recovered engine is picked up
    BackendAvailability availability = backend.probe();
    remember(availability);
    return availability;
}

ExecutionResult SandboxManager::execute(const std::string& code, const std::string& language,
                                        const std::string& backend, const ExecutionOptions& options) {
    return execute(ExecutionRequest(code, language, options), backend);
}

ExecutionResult SandboxManager::execute(const ExecutionRequest& request, const std::string& backend_name) {
    const auto started = std::chrono::steady_clock::now();
    auto finish = [&](ExecutionResult result) {
        result.execution_time = std::chrono::steady_clock::now() - started;
        return result;
    };

    if (!languages_->resolve(request.language())) {
        ExecutionResult result;
        result.backend = canonical_name(backend_name);
        result.language = request.language();
        result.fail(ErrorKind::UNSUPPORTED_LANGUAGE,
                    fmt::format("Unsupported language: {} (supported: {})", request.language(),
                                fmt::join(languages_->languages(), ", ")));
        spdlog::warn("{}", result.error->message);
        return finish(result);
    }

    IsolationBackend* target = backend(backend_name);
    if (!target) {
        return finish(unavailable_result(backend_name, request.language(),
                                         fmt::format("Unknown backend '{}' (registered: {})", backend_name,
                                                     fmt::join(backend_names(), ", "))));
    }

    ExecutionResult result;
    try {
        BackendAvailability availability = check_available(*target);
        if (!availability.available) {
            spdlog::warn("Backend {} unavailable: {}", target->name(), availability.detail);
            return finish(unavailable_result(target->name(), request.language(),
                                             fmt::format("Backend '{}' is unavailable: {}", target->name(),
                                                         availability.detail)));
        }
        result = target->execute(request);
    } catch (const std::exception& e) {
        spdlog::error("Backend {} threw: {}", target->name(), e.what());
        result = ExecutionResult{};
        result.backend = target->name();
        result.language = request.language();
        result.fail(ErrorKind::INTERNAL, fmt::format("Internal error: {}", e.what()));
        return finish(result);
    }

    if (result.error_kind() == ErrorKind::INFRASTRUCTURE_UNAVAILABLE) {
        remember(BackendAvailability{target->name(), false, result.error->message});
    }
    return result;
}

std::map<std::string, ExecutionResult> SandboxManager::compare(const std::string& code,
                                                               const std::string& language,
                                                               const ExecutionOptions& options) {
    ExecutionRequest request(code, language, options);

    std::map<std::string, ExecutionResult> results;
    for (const auto& b : backends_) {
        spdlog::info("Comparing on backend {}", b->name());
        results[b->name()] = execute(request, b->name());
    }
    return results;
}

std::map<std::string, BackendAvailability> SandboxManager::availability() {
    std::map<std::string, BackendAvailability> report;
    for (const auto& b : backends_) {
        BackendAvailability a = b->probe();
        remember(a);
        report[b->name()] = a;
    }
    return report;
}

std::map<std::string, BenchmarkStats> SandboxManager::benchmark(const std::string& code,
                                                                const std::string& language,
                                                                int runs) {
    if (runs < 1) {
        throw std::invalid_argument("benchmark needs at least one run");
    }
    ExecutionRequest request(code, language);

    std::map<std::string, BenchmarkStats> report;
    for (const auto& b : backends_) {
        BenchmarkStats stats;
        stats.backend = b->name();

        double total = 0.0;
        for (int i = 0; i < runs; i++) {
            ExecutionResult result = execute(request, b->name());
            stats.runs++;
            if (!result.success) {
                stats.error = fmt::format("{}: {}", error_kind_to_string(result.error_kind()),
                                          result.error_text());
                break;
            }

            double seconds = result.execution_time.count();
            if (stats.successes == 0 || seconds < stats.min_seconds) stats.min_seconds = seconds;
            if (stats.successes == 0 || seconds > stats.max_seconds) stats.max_seconds = seconds;
            total += seconds;
            stats.successes++;
        }
        if (stats.successes > 0) {
            stats.mean_seconds = total / stats.successes;
        }

        spdlog::info("Benchmark {}: {}/{} ok, mean {:.3f}s", stats.backend, stats.successes,
                     stats.runs, stats.mean_seconds);
        report[stats.backend] = stats;
    }
    return report;
}

nlohmann::json SandboxManager::info(const std::string& backend_name) const {
    IsolationBackend* target = backend(backend_name);
    if (!target) {
        return nullptr;
    }

    nlohmann::json j = target->describe();
    std::lock_guard<std::mutex> lock(availability_mutex_);
    auto it = availability_cache_.find(target->name());
    if (it != availability_cache_.end()) {
        j["availability"] = it->second.to_json();
    }
    return j;
}

} // namespace runbox::runtime
