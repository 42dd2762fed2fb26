/**
 * Execution request/result types shared by every isolation backend.
 *
 * Every call produces exactly one ExecutionResult. Failures are carried in
 * ExecutionResult::error instead of being thrown.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace runbox::runtime {

enum class ErrorKind {
    NONE,
    UNSUPPORTED_LANGUAGE,
    VALIDATION,
    LAUNCH_FAILURE,
    CONTAINER_STARTUP,
    RUNTIME_EXECUTION,
    TIMEOUT,
    IMAGE_RESOLUTION,
    INFRASTRUCTURE_UNAVAILABLE,
    BACKEND_UNAVAILABLE,
    INTERNAL
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::UNSUPPORTED_LANGUAGE: return "UnsupportedLanguageError";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::LAUNCH_FAILURE: return "LaunchFailure";
        case ErrorKind::CONTAINER_STARTUP: return "ContainerStartupError";
        case ErrorKind::RUNTIME_EXECUTION: return "RuntimeExecutionError";
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::IMAGE_RESOLUTION: return "ImageResolutionError";
        case ErrorKind::INFRASTRUCTURE_UNAVAILABLE: return "InfrastructureUnavailable";
        case ErrorKind::BACKEND_UNAVAILABLE: return "BackendUnavailable";
        case ErrorKind::INTERNAL: return "InternalError";
        default: return "InternalError";
    }
}

inline ErrorKind error_kind_from_string(const std::string& str) {
    if (str == "UnsupportedLanguageError") return ErrorKind::UNSUPPORTED_LANGUAGE;
    if (str == "ValidationError") return ErrorKind::VALIDATION;
    if (str == "LaunchFailure") return ErrorKind::LAUNCH_FAILURE;
    if (str == "ContainerStartupError") return ErrorKind::CONTAINER_STARTUP;
    if (str == "RuntimeExecutionError") return ErrorKind::RUNTIME_EXECUTION;
    if (str == "Timeout") return ErrorKind::TIMEOUT;
    if (str == "ImageResolutionError") return ErrorKind::IMAGE_RESOLUTION;
    if (str == "InfrastructureUnavailable") return ErrorKind::INFRASTRUCTURE_UNAVAILABLE;
    if (str == "BackendUnavailable") return ErrorKind::BACKEND_UNAVAILABLE;
    if (str == "InternalError") return ErrorKind::INTERNAL;
    return ErrorKind::NONE;
}

struct ErrorInfo {
    ErrorKind kind = ErrorKind::INTERNAL;
    std::string message;
};

// What the resource-limited backend actually managed to enforce
struct IsolationStatus {
    bool rlimits_applied = false;
    bool cgroup_applied = false;
    bool network_namespace = false;
    std::string degraded_reason;

    bool is_degraded() const { return !degraded_reason.empty(); }
    nlohmann::json to_json() const;
};

// Per-request overrides of the backend's SandboxConfig
struct ExecutionOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<uint64_t> memory_limit_bytes;
    std::optional<bool> network_enabled;
};

class ExecutionRequest {
public:
    // Throws std::invalid_argument when language is empty
    ExecutionRequest(std::string code, std::string language, ExecutionOptions options = {});

    const std::string& code() const { return code_; }
    const std::string& language() const { return language_; }
    const ExecutionOptions& options() const { return options_; }

private:
    std::string code_;
    std::string language_;
    ExecutionOptions options_;
};

struct ExecutionResult {
    bool success = false;
    std::string output;          // captured stdout
    std::string error_output;    // captured stderr
    int exit_code = -1;
    std::chrono::duration<double> execution_time{0.0};  // seconds
    std::string backend;
    std::string language;
    std::string execution_id;
    std::optional<std::string> container_id;
    std::optional<std::string> image;
    std::optional<ErrorInfo> error;
    std::optional<IsolationStatus> isolation;
    bool output_truncated = false;

    ErrorKind error_kind() const { return error ? error->kind : ErrorKind::NONE; }

    // Text for the external "error" field: stderr for runtime failures, the message otherwise
    std::string error_text() const;

    void fail(ErrorKind kind, std::string message);

    nlohmann::json to_json() const;
};

// Appended to a captured stream that hit the output cap
constexpr const char* TRUNCATION_MARKER = "\n[output truncated]";

// Unique per call; used to name temp dirs, cgroups and containers
std::string make_execution_id();

// First line of the code, at most max_len characters, for log lines
std::string code_preview(const std::string& code, size_t max_len = 50);

} // namespace runbox::runtime
