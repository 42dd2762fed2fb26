#include "runtime/container_sandbox.hpp"
#include "runtime/temp_workspace.hpp"
#include "util/config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <stdexcept>

namespace runbox::runtime {

namespace {

// Removes the container by name on scope exit. The name is known before
// `docker run` returns, so a half-created container is still cleaned up.
class ContainerGuard {
public:
    ContainerGuard(ContainerEngine& engine, std::string name)
        : engine_(engine), name_(std::move(name)) {}

    ~ContainerGuard() {
        EngineError error;
        if (!engine_.remove(name_, &error)) {
            spdlog::warn("Failed to remove container {}: {}", name_, error.message);
        } else {
            spdlog::debug("Removed container {}", name_);
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    ContainerEngine& engine_;
    std::string name_;
};

void fail_engine(ExecutionResult& result, const EngineError& error, ErrorKind otherwise,
                 const std::string& what) {
    if (error.unreachable) {
        result.fail(ErrorKind::INFRASTRUCTURE_UNAVAILABLE,
                    "Container engine unavailable: " + error.message);
    } else {
        result.fail(otherwise, what + ": " + error.message);
    }
}

} // namespace

ContainerSandbox::ContainerSandbox(SandboxConfig config,
                                   std::shared_ptr<const LanguageTable> languages,
                                   std::shared_ptr<ContainerEngine> engine,
                                   ContainerSettings settings)
    : IsolationBackend(config, std::move(languages)),
      engine_(std::move(engine)),
      settings_(std::move(settings)) {
    if (!engine_) {
        throw std::invalid_argument("container sandbox needs a container engine");
    }
    spdlog::info("Container sandbox ready (engine={}, timeout={}, memory={})", engine_->name(),
                 format_timeout(config_.timeout), util::format_memory_size(config_.memory_limit_bytes));
}

BackendAvailability ContainerSandbox::probe() const {
    BackendAvailability availability;
    availability.backend = name();

    EngineError error;
    availability.available = engine_->ping(&error);
    if (!availability.available) {
        availability.detail = error.message;
    }
    return availability;
}

nlohmann::json ContainerSandbox::describe() const {
    nlohmann::json j = IsolationBackend::describe();
    j["engine"] = engine_->name();
    j["user"] = settings_.user;
    j["pids_limit"] = settings_.pids_limit;
    j["images"] = nlohmann::json::object();
    for (const auto& profile : languages_->profiles()) {
        if (profile.image_reference) {
            j["images"][profile.language] = *profile.image_reference;
        }
    }
    return j;
}

bool ContainerSandbox::ensure_image(const std::string& image, EngineError* error) {
    std::shared_ptr<std::mutex> pull_lock;
    {
        std::lock_guard<std::mutex> lock(images_mutex_);
        if (ready_images_.count(image)) {
            return true;
        }
        auto& slot = pull_locks_[image];
        if (!slot) slot = std::make_shared<std::mutex>();
        pull_lock = slot;
    }

    // One pull per image; other callers wanting the same image wait here
    std::lock_guard<std::mutex> pulling(*pull_lock);
    {
        std::lock_guard<std::mutex> lock(images_mutex_);
        if (ready_images_.count(image)) {
            return true;
        }
    }

    bool exists = false;
    if (!engine_->image_exists(image, &exists, error)) {
        return false;
    }
    spdlog::debug("Image {} {}", image, exists ? "present" : "missing");

    if (!exists) {
        spdlog::info("Pulling image {} (first use)...", image);
        if (!engine_->pull_image(image, error)) {
            spdlog::warn("Pull of {} failed: {}", image, error->message);
            return false;
        }
        spdlog::info("Pulled image {}", image);
    }

    std::lock_guard<std::mutex> lock(images_mutex_);
    ready_images_.insert(image);
    return true;
}

size_t ContainerSandbox::purge() {
    std::vector<std::string> ids;
    EngineError error;
    if (!engine_->list_by_label(std::string(MANAGED_LABEL) + "=true", &ids, &error)) {
        spdlog::warn("Cannot list managed containers: {}", error.message);
        return 0;
    }

    size_t removed = 0;
    for (const auto& id : ids) {
        if (engine_->remove(id, &error)) {
            removed++;
        } else {
            spdlog::warn("Failed to remove container {}: {}", id, error.message);
        }
    }
    spdlog::info("Purged {} managed container(s)", removed);
    return removed;
}

void ContainerSandbox::run(const ExecutionContext& ctx, ExecutionResult& result) {
    if (!ctx.profile.image_reference) {
        result.fail(ErrorKind::IMAGE_RESOLUTION,
                    "No container image configured for " + ctx.profile.language);
        return;
    }
    const std::string& image = *ctx.profile.image_reference;
    result.image = image;

    EngineError error;
    if (!ensure_image(image, &error)) {
        fail_engine(result, error, ErrorKind::IMAGE_RESOLUTION, "Image " + image + " unavailable");
        return;
    }

    std::string message;
    auto workspace = TempWorkspace::create("runbox-" + ctx.execution_id, &message);
    if (!workspace) {
        result.fail(ErrorKind::CONTAINER_STARTUP, "Cannot create workspace: " + message);
        return;
    }
    if (workspace->write_file(ctx.profile.source_filename(), ctx.request.code(), &message).empty() ||
        !workspace->share_read_only(&message)) {
        result.fail(ErrorKind::CONTAINER_STARTUP, "Cannot prepare workspace: " + message);
        return;
    }

    const std::string& mount = settings_.mount_point;

    ContainerSpec spec;
    spec.name = "runbox-" + ctx.execution_id;
    spec.image = image;
    spec.command = ctx.profile.render_command(mount + "/" + ctx.profile.source_filename(), mount);
    spec.host_dir = workspace->path().string();
    spec.mount_point = mount;
    spec.user = settings_.user;
    spec.memory_limit_bytes = ctx.config.memory_limit_bytes;
    spec.pids_limit = settings_.pids_limit;
    spec.network_enabled = ctx.config.network_enabled;
    spec.env = ctx.profile.render_environment(mount);
    spec.env.emplace_back("HOME", "/tmp");
    spec.labels[MANAGED_LABEL] = "true";
    spec.labels["runbox.execution"] = ctx.execution_id;

    // Declared after the workspace: the container goes first, then the mounted dir
    ContainerGuard guard(*engine_, spec.name);

    std::string container_id;
    if (!engine_->start(spec, &container_id, &error)) {
        fail_engine(result, error, ErrorKind::CONTAINER_STARTUP, "Container failed to start");
        return;
    }
    result.container_id = container_id.substr(0, 12);

    WaitStatus status;
    if (!engine_->wait(spec.name, ctx.config.timeout, &status, &error)) {
        fail_engine(result, error, ErrorKind::INTERNAL, "Waiting for container failed");
        return;
    }

    if (!status.completed) {
        spdlog::info("Container {} exceeded {}, stopping", spec.name, format_timeout(ctx.config.timeout));
        EngineError stop_error;
        if (!engine_->stop(spec.name, settings_.stop_grace, &stop_error)) {
            spdlog::warn("Failed to stop container {}: {}", spec.name, stop_error.message);
        }
    }

    ContainerLogs logs;
    EngineError log_error;
    if (engine_->logs(spec.name, ctx.config.max_output_bytes, &logs, &log_error)) {
        result.output = logs.stdout_text;
        result.error_output = logs.stderr_text;
        if (logs.stdout_truncated) result.output += TRUNCATION_MARKER;
        if (logs.stderr_truncated) result.error_output += TRUNCATION_MARKER;
        result.output_truncated = logs.truncated();
    } else {
        spdlog::warn("Failed to fetch logs for {}: {}", spec.name, log_error.message);
    }

    if (!status.completed) {
        result.exit_code = -1;
        result.fail(ErrorKind::TIMEOUT,
                    fmt::format("Execution timed out after {}", format_timeout(ctx.config.timeout)));
        return;
    }

    result.exit_code = status.exit_code;
    if (status.exit_code != 0) {
        std::string detail = status.exit_code == 137
            ? "Container exited with code 137 (killed, possibly out of memory)"
            : fmt::format("Container exited with code {}", status.exit_code);
        result.fail(ErrorKind::RUNTIME_EXECUTION, detail);
        return;
    }

    result.success = true;
}

} // namespace runbox::runtime
