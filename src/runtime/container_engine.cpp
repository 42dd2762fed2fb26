#include "runtime/container_engine.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace runbox::runtime {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

void set_error(EngineError* error, bool unreachable, std::string message) {
    if (error) {
        error->unreachable = unreachable;
        error->message = std::move(message);
    }
}

} // namespace

nlohmann::json EngineInfo::to_json() const {
    nlohmann::json j;
    j["reachable"] = reachable;
    if (!reachable) {
        j["error"] = error;
        return j;
    }
    j["server_version"] = server_version;
    j["containers_running"] = containers_running;
    j["containers_total"] = containers_total;
    j["images"] = images;
    j["mem_total"] = mem_total;
    j["cpus"] = cpus;
    return j;
}

// ============================================================================
// DockerCliEngine
// ============================================================================

DockerCliEngine::DockerCliEngine(std::string binary,
                                 std::chrono::milliseconds command_timeout,
                                 std::chrono::milliseconds pull_timeout)
    : binary_(std::move(binary)),
      command_timeout_(command_timeout),
      pull_timeout_(pull_timeout) {}

bool DockerCliEngine::is_unreachable_message(const std::string& stderr_text) {
    static const char* markers[] = {
        "Cannot connect to the Docker daemon",
        "Is the docker daemon running",
        "error during connect",
        "permission denied while trying to connect",
        "connect: connection refused",
        "connect: no such file or directory",
    };
    for (const char* marker : markers) {
        if (stderr_text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ProcessOutcome DockerCliEngine::run_cli(const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout,
                                        size_t max_output) const {
    ProcessSpec spec;
    spec.argv.push_back(binary_);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.max_output_bytes = max_output;

    spdlog::trace("{} {}", binary_, args.empty() ? "" : args.front());
    return run_process(spec, timeout, std::chrono::milliseconds(500));
}

bool DockerCliEngine::check(const ProcessOutcome& outcome, const std::string& what,
                            EngineError* error) const {
    if (!outcome.launched) {
        set_error(error, true, "container engine CLI unavailable: " + outcome.launch_error);
        return false;
    }
    if (outcome.timed_out) {
        set_error(error, false, binary_ + " " + what + " timed out");
        return false;
    }
    if (outcome.exit_code != 0) {
        std::string detail = trim(outcome.stderr_text);
        if (detail.empty()) detail = "exit code " + std::to_string(outcome.exit_code);
        set_error(error, is_unreachable_message(detail), detail);
        return false;
    }
    return true;
}

bool DockerCliEngine::ping(EngineError* error) {
    auto outcome = run_cli({"version", "--format", "{{.Server.Version}}"}, command_timeout_);
    return check(outcome, "version", error);
}

EngineInfo DockerCliEngine::info() {
    EngineInfo info;
    EngineError error;
    auto outcome = run_cli({"info", "--format", "{{json .}}"}, command_timeout_);
    if (!check(outcome, "info", &error)) {
        info.error = error.message;
        return info;
    }

    try {
        auto j = nlohmann::json::parse(outcome.stdout_text);
        info.reachable = true;
        info.server_version = j.value("ServerVersion", "");
        info.containers_running = j.value("ContainersRunning", int64_t{0});
        info.containers_total = j.value("Containers", int64_t{0});
        info.images = j.value("Images", int64_t{0});
        info.mem_total = j.value("MemTotal", uint64_t{0});
        info.cpus = j.value("NCPU", int64_t{0});
    } catch (const std::exception& e) {
        info.reachable = false;
        info.error = std::string("unparseable docker info: ") + e.what();
    }
    return info;
}

bool DockerCliEngine::image_exists(const std::string& image, bool* exists, EngineError* error) {
    auto outcome = run_cli({"image", "inspect", "--format", "{{.Id}}", image}, command_timeout_);
    if (outcome.launched && !outcome.timed_out && outcome.exit_code != 0 &&
        !is_unreachable_message(outcome.stderr_text)) {
        // "No such image" (wording varies across versions)
        *exists = false;
        return true;
    }
    if (!check(outcome, "image inspect", error)) {
        return false;
    }
    *exists = true;
    return true;
}

bool DockerCliEngine::pull_image(const std::string& image, EngineError* error) {
    auto outcome = run_cli({"pull", "--quiet", image}, pull_timeout_, 64 * 1024);
    return check(outcome, "pull " + image, error);
}

std::vector<std::string> DockerCliEngine::run_arguments(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "--detach", "--name", spec.name};

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    if (!spec.network_enabled) {
        args.push_back("--network");
        args.push_back("none");
    }
    if (!spec.user.empty()) {
        args.push_back("--user");
        args.push_back(spec.user);
    }
    if (spec.memory_limit_bytes > 0) {
        // Same value for swap: no swap on top of the ceiling
        args.push_back("--memory");
        args.push_back(std::to_string(spec.memory_limit_bytes));
        args.push_back("--memory-swap");
        args.push_back(std::to_string(spec.memory_limit_bytes));
    }
    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.pids_limit));
    }

    args.insert(args.end(), {
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--read-only",
        "--tmpfs", "/tmp:rw,exec,size=64m",
    });

    for (const auto& [key, value] : spec.env) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }

    args.push_back("--volume");
    args.push_back(spec.host_dir + ":" + spec.mount_point + ":ro");
    args.push_back("--workdir");
    args.push_back(spec.mount_point);

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

bool DockerCliEngine::start(const ContainerSpec& spec, std::string* container_id, EngineError* error) {
    auto outcome = run_cli(run_arguments(spec), command_timeout_);
    if (!check(outcome, "run", error)) {
        return false;
    }
    *container_id = trim(outcome.stdout_text);
    spdlog::debug("Started container {} ({})", spec.name, container_id->substr(0, 12));
    return true;
}

bool DockerCliEngine::wait(const std::string& container, std::chrono::milliseconds timeout,
                           WaitStatus* status, EngineError* error) {
    auto outcome = run_cli({"wait", container}, timeout);
    if (outcome.launched && outcome.timed_out) {
        // The CLI client was killed; the container keeps running
        status->completed = false;
        return true;
    }
    if (!check(outcome, "wait", error)) {
        return false;
    }

    try {
        status->exit_code = std::stoi(trim(outcome.stdout_text));
        status->completed = true;
    } catch (const std::exception&) {
        set_error(error, false, "unexpected docker wait output: " + trim(outcome.stdout_text));
        return false;
    }
    return true;
}

bool DockerCliEngine::logs(const std::string& container, size_t max_bytes,
                           ContainerLogs* logs, EngineError* error) {
    auto outcome = run_cli({"logs", container}, command_timeout_, max_bytes);
    if (!check(outcome, "logs", error)) {
        return false;
    }
    logs->stdout_text = outcome.stdout_text;
    logs->stderr_text = outcome.stderr_text;
    logs->stdout_truncated = outcome.stdout_truncated;
    logs->stderr_truncated = outcome.stderr_truncated;
    return true;
}

bool DockerCliEngine::stop(const std::string& container, std::chrono::seconds grace, EngineError* error) {
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(grace) + command_timeout_;
    auto outcome = run_cli({"stop", "--time", std::to_string(grace.count()), container}, timeout);
    return check(outcome, "stop", error);
}

bool DockerCliEngine::remove(const std::string& container, EngineError* error) {
    auto outcome = run_cli({"rm", "--force", container}, command_timeout_);
    if (outcome.launched && !outcome.timed_out && outcome.exit_code != 0 &&
        outcome.stderr_text.find("No such container") != std::string::npos) {
        return true;
    }
    return check(outcome, "rm", error);
}

bool DockerCliEngine::list_by_label(const std::string& label, std::vector<std::string>* ids,
                                    EngineError* error) {
    auto outcome = run_cli({"ps", "--all", "--quiet", "--filter", "label=" + label}, command_timeout_);
    if (!check(outcome, "ps", error)) {
        return false;
    }
    *ids = lines(outcome.stdout_text);
    return true;
}

} // namespace runbox::runtime
