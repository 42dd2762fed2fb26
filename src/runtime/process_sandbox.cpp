#include "runtime/process_sandbox.hpp"
#include "runtime/temp_workspace.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

namespace runbox::runtime {

std::pair<std::vector<std::string>, std::vector<std::string>>
find_interpreters(const LanguageTable& languages) {
    std::vector<std::string> found;
    std::vector<std::string> missing;
    for (const auto& profile : languages.profiles()) {
        const std::string& interpreter = profile.run_command.front();
        if (resolve_executable(interpreter).empty()) {
            missing.push_back(interpreter);
        } else {
            found.push_back(interpreter);
        }
    }
    return {found, missing};
}

ProcessSandbox::ProcessSandbox(SandboxConfig config, std::shared_ptr<const LanguageTable> languages,
                               bool announce)
    : IsolationBackend(config, std::move(languages)) {
    if (announce) spdlog::info("Process sandbox ready (timeout={})", format_timeout(config_.timeout));
}

BackendAvailability ProcessSandbox::probe() const {
    auto [found, missing] = find_interpreters(*languages_);

    BackendAvailability availability;
    availability.backend = name();
    availability.available = !found.empty();
    if (found.empty()) {
        availability.detail = "no interpreter found on PATH";
    } else if (!missing.empty()) {
        availability.detail = fmt::format("missing: {}", fmt::join(missing, ", "));
    }
    return availability;
}

void ProcessSandbox::run(const ExecutionContext& ctx, ExecutionResult& result) {
    launch(ctx, LaunchOptions{}, result);
}

LaunchReport ProcessSandbox::launch(const ExecutionContext& ctx, const LaunchOptions& options,
                                    ExecutionResult& result) const {
    LaunchReport report;
    std::string error;

    auto workspace = TempWorkspace::create("runbox-" + ctx.execution_id, &error);
    if (!workspace) {
        result.fail(ErrorKind::LAUNCH_FAILURE, "Cannot create workspace: " + error);
        return report;
    }

    auto source = workspace->write_file(ctx.profile.source_filename(), ctx.request.code(), &error);
    if (source.empty()) {
        result.fail(ErrorKind::LAUNCH_FAILURE, "Cannot write source file: " + error);
        return report;
    }

    const std::string dir = workspace->path().string();

    ProcessSpec spec;
    spec.argv = ctx.profile.render_command(source.string(), dir);
    spec.working_dir = dir;
    spec.env = ctx.profile.render_environment(dir);
    spec.clear_environment = options.clear_environment;
    spec.limits = options.limits;
    spec.isolate_network = options.isolate_network;
    spec.max_output_bytes = ctx.config.max_output_bytes;

    ChildProcess child(spec);
    if (!child.spawn(options.on_spawned)) {
        result.fail(ErrorKind::LAUNCH_FAILURE,
                    fmt::format("Failed to launch {}: {}", ctx.profile.language,
                                child.outcome().launch_error));
        return report;
    }
    report.launched = true;

    const ProcessOutcome& outcome = child.communicate(ctx.config.timeout, ctx.config.kill_grace);
    report.rlimits_applied = outcome.rlimits_applied;
    report.network_isolated = outcome.network_isolated;

    result.output = outcome.stdout_text;
    result.error_output = outcome.stderr_text;
    if (outcome.stdout_truncated) result.output += TRUNCATION_MARKER;
    if (outcome.stderr_truncated) result.error_output += TRUNCATION_MARKER;
    result.output_truncated = outcome.truncated();
    result.exit_code = outcome.exit_code;

    if (outcome.timed_out) {
        result.fail(ErrorKind::TIMEOUT,
                    fmt::format("Execution timed out after {}", format_timeout(ctx.config.timeout)));
        return report;
    }

    if (outcome.exit_code != 0) {
        std::string message = outcome.term_signal
            ? fmt::format("Process killed by signal {}", outcome.term_signal)
            : fmt::format("Process exited with code {}", outcome.exit_code);
        result.fail(ErrorKind::RUNTIME_EXECUTION, message);
        return report;
    }

    result.success = true;
    return report;
}

} // namespace runbox::runtime
