/**
 * runbox configuration
 *
 * Settings come from defaults, then an optional JSON file, then RUNBOX_*
 * environment variables (a .env file is loaded into the environment first).
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace runbox::util {

struct Settings {
    std::chrono::milliseconds process_timeout{10000};
    std::chrono::milliseconds resource_limited_timeout{5000};
    std::chrono::milliseconds container_timeout{30000};

    uint64_t memory_limit_bytes = 128ULL * 1024 * 1024;
    uint64_t container_memory_limit_bytes = 128ULL * 1024 * 1024;

    bool security_screen_enabled = true;
    bool network_enabled = false;

    std::chrono::milliseconds kill_grace{1000};
    size_t max_output_bytes = 1024 * 1024;

    std::string container_user = "1000:1000";
    int64_t container_pids_limit = 64;
    std::string docker_binary = "docker";

    std::string languages_file;     // empty = built-in table
    std::string log_level = "info";
    std::string log_file;

    // Overlay RUNBOX_* variables onto the current values
    void apply_env();

    static Settings from_env();

    // Missing keys keep their current value
    static Settings from_json(const nlohmann::json& j);
    static Settings from_json(const nlohmann::json& j, const Settings& base);
    nlohmann::json to_json() const;

    static bool load_file(const std::string& path, Settings* out, std::string* error_msg);
};

// Load the first .env found (cwd, parents, next to the executable). Existing variables win.
void load_dotenv();

// "128m", "1g", "64kb", "65536" -> bytes
std::optional<uint64_t> parse_memory_size(const std::string& text);
std::string format_memory_size(uint64_t bytes);

std::optional<bool> parse_bool(const std::string& text);

} // namespace runbox::util
