#pragma once
#include <string>
#include <vector>

#include "runtime/backend.hpp"
#include "runtime/child_process.hpp"

namespace runbox::runtime {

// Extra constraints a wrapping backend asks for
struct LaunchOptions {
    ResourceCeilings limits;
    bool clear_environment = false;
    bool isolate_network = false;
    ChildProcess::SpawnHook on_spawned;
};

struct LaunchReport {
    bool launched = false;
    bool rlimits_applied = false;
    bool network_isolated = false;
};

// Bare child process with a wall-clock deadline. No screening, no ceilings.
class ProcessSandbox : public IsolationBackend {
public:
    // announce = false for a runner composed into another backend
    ProcessSandbox(SandboxConfig config, std::shared_ptr<const LanguageTable> languages,
                   bool announce = true);

    std::string name() const override { return "process"; }
    BackendAvailability probe() const override;

    // Write the code into a private temp dir and run it there. The dir is gone on return.
    LaunchReport launch(const ExecutionContext& ctx, const LaunchOptions& options,
                        ExecutionResult& result) const;

protected:
    void run(const ExecutionContext& ctx, ExecutionResult& result) override;
};

// Interpreters of the table found on PATH (first) and missing (second)
std::pair<std::vector<std::string>, std::vector<std::string>>
find_interpreters(const LanguageTable& languages);

} // namespace runbox::runtime
