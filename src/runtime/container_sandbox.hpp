/**
 * Container backend: one ephemeral container per call.
 *
 * The code is written into a private temp dir that is bind-mounted read-only.
 * The container runs detached as a non-root user with no network (unless the
 * request enables it), a memory ceiling and a pids limit. The container and
 * the temp dir are removed on every exit path.
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "runtime/backend.hpp"
#include "runtime/container_engine.hpp"

namespace runbox::runtime {

struct ContainerSettings {
    std::string user = "1000:1000";
    int64_t pids_limit = 64;
    std::chrono::seconds stop_grace{1};
    std::string mount_point = "/workspace";
};

class ContainerSandbox : public IsolationBackend {
public:
    static constexpr const char* MANAGED_LABEL = "runbox.managed";

    ContainerSandbox(SandboxConfig config,
                     std::shared_ptr<const LanguageTable> languages,
                     std::shared_ptr<ContainerEngine> engine,
                     ContainerSettings settings = {});

    std::string name() const override { return "container"; }
    BackendAvailability probe() const override;
    nlohmann::json describe() const override;

    // Present locally (pulling on first use). Cached once confirmed.
    bool ensure_image(const std::string& image, EngineError* error);

    // Force-remove every container carrying our label. Returns how many were removed.
    size_t purge();

    EngineInfo engine_info() const { return engine_->info(); }

protected:
    void run(const ExecutionContext& ctx, ExecutionResult& result) override;

private:
    std::shared_ptr<ContainerEngine> engine_;
    ContainerSettings settings_;

    std::mutex images_mutex_;
    std::set<std::string> ready_images_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> pull_locks_;
};

} // namespace runbox::runtime
