/**
 * Container engine seam.
 *
 * ContainerSandbox only talks to this interface. DockerCliEngine drives the
 * docker CLI as child processes; tests substitute a fake engine.
 *
 * Every operation returns false on failure and fills EngineError. The
 * `unreachable` flag separates "the engine is down" from "this request failed".
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "runtime/child_process.hpp"

namespace runbox::runtime {

struct EngineError {
    bool unreachable = false;
    std::string message;
};

struct EngineInfo {
    bool reachable = false;
    std::string server_version;
    int64_t containers_running = 0;
    int64_t containers_total = 0;
    int64_t images = 0;
    uint64_t mem_total = 0;
    int64_t cpus = 0;
    std::string error;

    nlohmann::json to_json() const;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::string host_dir;                    // bind-mounted read-only at mount_point
    std::string mount_point = "/workspace";
    std::string user;                        // "uid:gid"
    uint64_t memory_limit_bytes = 0;
    int64_t pids_limit = 0;
    bool network_enabled = false;
    std::vector<std::pair<std::string, std::string>> env;
    std::map<std::string, std::string> labels;
};

struct WaitStatus {
    bool completed = false;   // false = still running at the deadline
    int exit_code = -1;
};

struct ContainerLogs {
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool truncated() const { return stdout_truncated || stderr_truncated; }
};

class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual std::string name() const = 0;

    virtual bool ping(EngineError* error) = 0;
    virtual EngineInfo info() = 0;

    // true with *exists set, or false when the question could not be answered
    virtual bool image_exists(const std::string& image, bool* exists, EngineError* error) = 0;
    virtual bool pull_image(const std::string& image, EngineError* error) = 0;

    // Create and start detached
    virtual bool start(const ContainerSpec& spec, std::string* container_id, EngineError* error) = 0;

    virtual bool wait(const std::string& container, std::chrono::milliseconds timeout,
                      WaitStatus* status, EngineError* error) = 0;

    virtual bool logs(const std::string& container, size_t max_bytes,
                      ContainerLogs* logs, EngineError* error) = 0;

    virtual bool stop(const std::string& container, std::chrono::seconds grace, EngineError* error) = 0;

    // Force removal. A container that no longer exists counts as removed.
    virtual bool remove(const std::string& container, EngineError* error) = 0;

    virtual bool list_by_label(const std::string& label, std::vector<std::string>* ids,
                               EngineError* error) = 0;
};

class DockerCliEngine : public ContainerEngine {
public:
    explicit DockerCliEngine(std::string binary = "docker",
                             std::chrono::milliseconds command_timeout = std::chrono::seconds(30),
                             std::chrono::milliseconds pull_timeout = std::chrono::minutes(10));

    std::string name() const override { return "docker"; }

    bool ping(EngineError* error) override;
    EngineInfo info() override;
    bool image_exists(const std::string& image, bool* exists, EngineError* error) override;
    bool pull_image(const std::string& image, EngineError* error) override;
    bool start(const ContainerSpec& spec, std::string* container_id, EngineError* error) override;
    bool wait(const std::string& container, std::chrono::milliseconds timeout,
              WaitStatus* status, EngineError* error) override;
    bool logs(const std::string& container, size_t max_bytes,
              ContainerLogs* logs, EngineError* error) override;
    bool stop(const std::string& container, std::chrono::seconds grace, EngineError* error) override;
    bool remove(const std::string& container, EngineError* error) override;
    bool list_by_label(const std::string& label, std::vector<std::string>* ids,
                       EngineError* error) override;

    // docker run arguments for spec (without the binary)
    static std::vector<std::string> run_arguments(const ContainerSpec& spec);

    // Does this CLI stderr mean the daemon itself is unreachable?
    static bool is_unreachable_message(const std::string& stderr_text);

private:
    std::string binary_;
    std::chrono::milliseconds command_timeout_;
    std::chrono::milliseconds pull_timeout_;

    ProcessOutcome run_cli(const std::vector<std::string>& args,
                           std::chrono::milliseconds timeout,
                           size_t max_output = 1024 * 1024) const;

    // false when the command did not exit 0; fills error
    bool check(const ProcessOutcome& outcome, const std::string& what, EngineError* error) const;
};

} // namespace runbox::runtime
