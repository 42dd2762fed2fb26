#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <nlohmann/json.hpp>

#include "runtime/container_sandbox.hpp"
#include "runtime/sandbox_manager.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using runbox::runtime::ExecutionOptions;
using runbox::runtime::ExecutionResult;
using runbox::runtime::SandboxManager;

namespace {

constexpr const char* VERSION = "0.1.0";

enum class Mode {
    EXECUTE,
    COMPARE,
    AVAILABILITY,
    BENCHMARK,
    INFO,
    PURGE
};

struct CliOptions {
    Mode mode = Mode::EXECUTE;
    std::string code;
    std::string file;
    std::string language = "python";
    std::string backend = SandboxManager::DEFAULT_BACKEND;
    std::string output_file;
    std::string config_file;
    std::string log_level;
    ExecutionOptions overrides;
    int runs = 3;
    bool json = false;
    bool quiet = false;
};

void print_banner() {
    fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold,
               "\n    runbox v{}  ·  multi-backend code sandbox\n\n", VERSION);
}

void print_usage() {
    fmt::print(
        "Usage: runbox [options]\n"
        "\n"
        "  -e, --execute CODE     code to run\n"
        "  -f, --file PATH        read code from a file\n"
        "  -l, --language LANG    language (default: python)\n"
        "  -s, --sandbox NAME     process | resource_limited | container (default: resource_limited)\n"
        "  -t, --timeout SECONDS  override the backend timeout\n"
        "  -m, --memory SIZE      override the memory limit (e.g. 64m)\n"
        "      --network          allow outbound network for this run\n"
        "      --compare          run on every backend\n"
        "      --availability     report which backends are usable\n"
        "      --benchmark        time repeated runs on every backend\n"
        "      --runs N           benchmark repetitions (default: 3)\n"
        "      --info NAME        describe a backend\n"
        "      --purge            remove leftover runbox containers\n"
        "      --config FILE      JSON settings file\n"
        "  -o, --output FILE      write the result as JSON to FILE\n"
        "      --json             print JSON instead of text\n"
        "      --log-level LEVEL  trace|debug|info|warn|error|off\n"
        "  -q, --quiet            only warnings and errors in the log\n"
        "  -h, --help             show this help\n"
        "      --version          print the version\n");
}

void setup_logging(const CliOptions& cli, const runbox::util::Settings& settings) {
    std::string level_name = cli.log_level.empty() ? settings.log_level : cli.log_level;
    auto level = runbox::util::log_level_from_string(level_name);
    if (cli.quiet) {
        level = spdlog::level::warn;
    }
    // Keep stdout parseable
    if (cli.json && cli.log_level.empty()) {
        level = spdlog::level::err;
    }
    runbox::util::init_logger(level.value_or(spdlog::level::info), settings.log_file);
    if (!level) {
        spdlog::warn("Unknown log level '{}', using info", level_name);
    }
}

// 0 = ok, otherwise the process exit code
int parse_args(int argc, char** argv, CliOptions& cli) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                fmt::print(stderr, "{} needs a value\n", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage();
            return -1;
        } else if (arg == "--version") {
            fmt::print("runbox {}\n", VERSION);
            return -1;
        } else if (arg == "-e" || arg == "--execute") {
            const char* v = value("--execute");
            if (!v) return 2;
            cli.code = v;
        } else if (arg == "-f" || arg == "--file") {
            const char* v = value("--file");
            if (!v) return 2;
            cli.file = v;
        } else if (arg == "-l" || arg == "--language") {
            const char* v = value("--language");
            if (!v) return 2;
            cli.language = v;
        } else if (arg == "-s" || arg == "--sandbox") {
            const char* v = value("--sandbox");
            if (!v) return 2;
            cli.backend = v;
        } else if (arg == "-t" || arg == "--timeout") {
            const char* v = value("--timeout");
            if (!v) return 2;
            try {
                double seconds = std::stod(v);
                if (seconds <= 0) throw std::out_of_range("timeout");
                cli.overrides.timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
            } catch (const std::exception&) {
                fmt::print(stderr, "invalid timeout: {}\n", v);
                return 2;
            }
        } else if (arg == "-m" || arg == "--memory") {
            const char* v = value("--memory");
            if (!v) return 2;
            auto bytes = runbox::util::parse_memory_size(v);
            if (!bytes) {
                fmt::print(stderr, "invalid memory size: {}\n", v);
                return 2;
            }
            cli.overrides.memory_limit_bytes = *bytes;
        } else if (arg == "--network") {
            cli.overrides.network_enabled = true;
        } else if (arg == "--compare") {
            cli.mode = Mode::COMPARE;
        } else if (arg == "--availability") {
            cli.mode = Mode::AVAILABILITY;
        } else if (arg == "--benchmark") {
            cli.mode = Mode::BENCHMARK;
        } else if (arg == "--runs") {
            const char* v = value("--runs");
            if (!v) return 2;
            try {
                cli.runs = std::stoi(v);
            } catch (const std::exception&) {
                cli.runs = 0;
            }
            if (cli.runs < 1) {
                fmt::print(stderr, "invalid run count: {}\n", v);
                return 2;
            }
        } else if (arg == "--info") {
            const char* v = value("--info");
            if (!v) return 2;
            cli.mode = Mode::INFO;
            cli.backend = v;
        } else if (arg == "--purge") {
            cli.mode = Mode::PURGE;
        } else if (arg == "--config") {
            const char* v = value("--config");
            if (!v) return 2;
            cli.config_file = v;
        } else if (arg == "-o" || arg == "--output") {
            const char* v = value("--output");
            if (!v) return 2;
            cli.output_file = v;
        } else if (arg == "--json") {
            cli.json = true;
        } else if (arg == "--log-level") {
            const char* v = value("--log-level");
            if (!v) return 2;
            cli.log_level = v;
        } else if (arg == "-q" || arg == "--quiet") {
            cli.quiet = true;
        } else {
            fmt::print(stderr, "unknown option: {}\n\n", arg);
            print_usage();
            return 2;
        }
    }
    return 0;
}

bool load_code(CliOptions& cli) {
    if (cli.file.empty()) {
        return true;
    }
    std::ifstream in(cli.file);
    if (!in.is_open()) {
        fmt::print(stderr, "cannot read {}\n", cli.file);
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    cli.code = buffer.str();
    return true;
}

void print_result(const ExecutionResult& result) {
    auto status_style = result.success ? fg(fmt::color::green) : fg(fmt::color::red);
    fmt::print(status_style | fmt::emphasis::bold, "  {} {}", result.success ? "✓" : "✗", result.backend);
    fmt::print(fmt::emphasis::faint, "  {} · exit {} · {:.3f}s\n", result.language, result.exit_code,
               result.execution_time.count());

    if (result.image) {
        fmt::print(fmt::emphasis::faint, "    image {}  container {}\n", *result.image,
                   result.container_id.value_or("-"));
    }
    if (!result.output.empty()) {
        fmt::print("{}", result.output);
        if (result.output.back() != '\n') fmt::print("\n");
    }
    if (result.error) {
        fmt::print(fg(fmt::color::yellow), "    [{}] ", runbox::runtime::error_kind_to_string(result.error->kind));
        fmt::print("{}\n", result.error_text());
    } else if (!result.error_output.empty()) {
        fmt::print(fg(fmt::color::yellow), "{}", result.error_output);
    }
}

int emit_json(const CliOptions& cli, const nlohmann::json& j) {
    if (!cli.output_file.empty()) {
        std::ofstream out(cli.output_file);
        if (!out.is_open()) {
            spdlog::error("Cannot write {}", cli.output_file);
            return 1;
        }
        out << j.dump(2) << "\n";
        spdlog::info("Result written to {}", cli.output_file);
    }
    if (cli.json) {
        std::cout << j.dump(2) << std::endl;
    }
    return 0;
}

int run_mode(const CliOptions& cli, SandboxManager& manager) {
    const bool text = !cli.json;

    switch (cli.mode) {
        case Mode::EXECUTE: {
            ExecutionResult result = manager.execute(cli.code, cli.language, cli.backend, cli.overrides);
            if (text) print_result(result);
            int rc = emit_json(cli, result.to_json());
            return rc != 0 ? rc : (result.success ? 0 : 1);
        }
        case Mode::COMPARE: {
            auto results = manager.compare(cli.code, cli.language, cli.overrides);
            nlohmann::json j = nlohmann::json::object();
            bool all_ok = true;
            for (const auto& [name, result] : results) {
                if (text) print_result(result);
                j[name] = result.to_json();
                all_ok = all_ok && result.success;
            }
            int rc = emit_json(cli, j);
            return rc != 0 ? rc : (all_ok ? 0 : 1);
        }
        case Mode::AVAILABILITY: {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& [name, a] : manager.availability()) {
                if (text) {
                    fmt::print(a.available ? fg(fmt::color::green) : fg(fmt::color::red),
                               "  {} {:<18}", a.available ? "●" : "○", name);
                    fmt::print("{}\n", a.detail);
                }
                j[name] = a.to_json();
            }
            return emit_json(cli, j);
        }
        case Mode::BENCHMARK: {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& [name, stats] : manager.benchmark(cli.code, cli.language, cli.runs)) {
                if (text) {
                    fmt::print(fmt::emphasis::bold, "  {:<18}", name);
                    fmt::print("{}/{} ok  min {:.3f}s  max {:.3f}s  mean {:.3f}s\n", stats.successes,
                               stats.runs, stats.min_seconds, stats.max_seconds, stats.mean_seconds);
                    if (!stats.error.empty()) {
                        fmt::print(fg(fmt::color::yellow), "    {}\n", stats.error);
                    }
                }
                j[name] = stats.to_json();
            }
            return emit_json(cli, j);
        }
        case Mode::INFO: {
            nlohmann::json j = manager.info(cli.backend);
            if (j.is_null()) {
                spdlog::error("Unknown backend {}", cli.backend);
                return 1;
            }
            if (text) std::cout << j.dump(2) << std::endl;
            return emit_json(cli, j);
        }
        case Mode::PURGE: {
            auto* container = dynamic_cast<runbox::runtime::ContainerSandbox*>(manager.backend("container"));
            if (!container) {
                spdlog::error("No container backend registered");
                return 1;
            }
            size_t removed = container->purge();
            if (text) fmt::print("  removed {} container(s)\n", removed);
            return emit_json(cli, nlohmann::json{{"removed", removed}});
        }
    }
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    int rc = parse_args(argc, argv, cli);
    if (rc != 0) {
        return rc < 0 ? 0 : rc;
    }

    runbox::util::load_dotenv();
    runbox::util::Settings settings;
    if (!cli.config_file.empty()) {
        std::string error;
        if (!runbox::util::Settings::load_file(cli.config_file, &settings, &error)) {
            fmt::print(stderr, "cannot load config: {}\n", error);
            return 2;
        }
    }
    settings.apply_env();

    setup_logging(cli, settings);

    if (!load_code(cli)) {
        return 2;
    }

    const bool needs_code = cli.mode == Mode::EXECUTE || cli.mode == Mode::COMPARE ||
                            cli.mode == Mode::BENCHMARK;
    if (needs_code && cli.code.empty()) {
        fmt::print(stderr, "no code given (use -e CODE or -f FILE)\n\n");
        print_usage();
        return 2;
    }

    if (!cli.json && !cli.quiet) {
        print_banner();
    }

    try {
        auto manager = SandboxManager::create_default(settings);
        return run_mode(cli, *manager);
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid request: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
