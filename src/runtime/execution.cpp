#include "runtime/execution.hpp"

#include <atomic>
#include <random>
#include <stdexcept>
#include <fmt/core.h>
#include <unistd.h>

namespace runbox::runtime {

static std::atomic<uint32_t> g_next_execution{1};

nlohmann::json IsolationStatus::to_json() const {
    nlohmann::json j;
    j["rlimits_applied"] = rlimits_applied;
    j["cgroup_applied"] = cgroup_applied;
    j["network_namespace"] = network_namespace;
    if (!degraded_reason.empty()) {
        j["degraded_reason"] = degraded_reason;
    }
    return j;
}

ExecutionRequest::ExecutionRequest(std::string code, std::string language, ExecutionOptions options)
    : code_(std::move(code)), language_(std::move(language)), options_(std::move(options)) {
    if (language_.empty()) {
        throw std::invalid_argument("execution request needs a language");
    }
    if (options_.timeout && options_.timeout->count() <= 0) {
        throw std::invalid_argument("timeout override must be positive");
    }
    if (options_.memory_limit_bytes && *options_.memory_limit_bytes == 0) {
        throw std::invalid_argument("memory limit override must be positive");
    }
}

std::string ExecutionResult::error_text() const {
    if (!error) {
        return error_output;
    }
    if (error->kind == ErrorKind::RUNTIME_EXECUTION && !error_output.empty()) {
        return error_output;
    }
    return error->message;
}

void ExecutionResult::fail(ErrorKind kind, std::string message) {
    success = false;
    error = ErrorInfo{kind, std::move(message)};
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["output"] = output;
    j["error"] = error_text();
    j["exit_code"] = exit_code;
    j["execution_time"] = execution_time.count();
    j["backend"] = backend;
    j["language"] = language;
    j["execution_id"] = execution_id;
    j["output_truncated"] = output_truncated;

    if (error) {
        j["error_kind"] = error_kind_to_string(error->kind);
        j["error_message"] = error->message;
    }
    if (container_id) j["container_id"] = *container_id;
    if (image) j["image"] = *image;
    if (isolation) j["isolation"] = isolation->to_json();

    return j;
}

std::string make_execution_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    uint32_t seq = g_next_execution.fetch_add(1);
    return fmt::format("{:x}-{:x}-{:08x}", static_cast<unsigned>(getpid()), seq,
                       static_cast<uint32_t>(rng()));
}

std::string code_preview(const std::string& code, size_t max_len) {
    std::string line = code.substr(0, code.find('\n'));
    if (line.size() > max_len) {
        line = line.substr(0, max_len) + "...";
    }
    return line;
}

} // namespace runbox::runtime
