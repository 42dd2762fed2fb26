#include "util/config.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace runbox::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

std::optional<long long> parse_integer(const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Seconds, fractional allowed ("2.5")
std::optional<std::chrono::milliseconds> parse_seconds(const std::string& text) {
    try {
        size_t used = 0;
        double seconds = std::stod(text, &used);
        if (used != text.size() || seconds <= 0) return std::nullopt;
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void env_seconds(const char* name, std::chrono::milliseconds& target) {
    if (auto raw = env(name)) {
        if (auto value = parse_seconds(*raw)) {
            target = *value;
        } else {
            spdlog::warn("Ignoring {}={}: expected a positive number of seconds", name, *raw);
        }
    }
}

void env_size(const char* name, uint64_t& target) {
    if (auto raw = env(name)) {
        if (auto value = parse_memory_size(*raw)) {
            target = *value;
        } else {
            spdlog::warn("Ignoring {}={}: expected a size like 128m", name, *raw);
        }
    }
}

void env_flag(const char* name, bool& target) {
    if (auto raw = env(name)) {
        if (auto value = parse_bool(*raw)) {
            target = *value;
        } else {
            spdlog::warn("Ignoring {}={}: expected a boolean", name, *raw);
        }
    }
}

template <typename T>
void env_positive(const char* name, T& target) {
    if (auto raw = env(name)) {
        auto value = parse_integer(*raw);
        if (value && *value > 0) {
            target = static_cast<T>(*value);
        } else {
            spdlog::warn("Ignoring {}={}: expected a positive integer", name, *raw);
        }
    }
}

void env_string(const char* name, std::string& target) {
    if (auto raw = env(name)) {
        target = *raw;
    }
}

double to_seconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

std::chrono::milliseconds from_seconds(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

// JSON sizes may be numbers (bytes) or size strings
uint64_t json_size(const nlohmann::json& value, uint64_t fallback, const char* key) {
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > 0) return value.get<uint64_t>();
    } else if (value.is_number_integer()) {
        // Signed values are checked before the cast; a negative one would wrap
        if (value.get<int64_t>() > 0) return static_cast<uint64_t>(value.get<int64_t>());
    }
    if (value.is_string()) {
        if (auto parsed = parse_memory_size(value.get<std::string>())) return *parsed;
    }
    spdlog::warn("Ignoring settings key {}: expected a positive size", key);
    return fallback;
}

void json_seconds(const nlohmann::json& j, const char* key, std::chrono::milliseconds& target) {
    if (!j.contains(key)) return;
    const auto& value = j[key];
    if (value.is_number() && value.get<double>() > 0) {
        target = from_seconds(value.get<double>());
    } else {
        spdlog::warn("Ignoring settings key {}: expected a positive number of seconds", key);
    }
}

} // namespace

// ============================================================================
// .env loading
// ============================================================================

void load_dotenv() {
    static std::once_flag once;
    std::call_once(once, [] {
        std::vector<fs::path> search_paths = {
            fs::current_path() / ".env",
            "../.env",
            "../../.env",
        };

        char exe_path[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
        if (len != -1) {
            exe_path[len] = '\0';
            auto exe_dir = fs::path(exe_path).parent_path();
            search_paths.push_back(exe_dir / ".env");
            search_paths.push_back(exe_dir.parent_path() / ".env");
        }

        for (const auto& env_path : search_paths) {
            std::error_code ec;
            if (!fs::is_regular_file(env_path, ec)) continue;

            std::ifstream file(env_path);
            std::string line;
            while (std::getline(file, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') continue;
                if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

                size_t eq_pos = line.find('=');
                if (eq_pos == std::string::npos) continue;

                std::string key = trim(line.substr(0, eq_pos));
                std::string value = trim(line.substr(eq_pos + 1));

                if (value.size() >= 2) {
                    if ((value.front() == '"' && value.back() == '"') ||
                        (value.front() == '\'' && value.back() == '\'')) {
                        value = value.substr(1, value.size() - 2);
                    }
                }

                if (!key.empty() && !value.empty() && std::getenv(key.c_str()) == nullptr) {
                    setenv(key.c_str(), value.c_str(), 0);
                }
            }
            spdlog::debug("Loaded environment from {}", env_path.string());
            break;
        }
    });
}

// ============================================================================
// Value parsing
// ============================================================================

std::optional<uint64_t> parse_memory_size(const std::string& text) {
    std::string s = to_lower(trim(text));
    if (s.empty()) return std::nullopt;

    // Optional trailing 'b' ("mb", "kb", plain "b")
    if (s.size() >= 2 && s.back() == 'b' && std::isalpha(static_cast<unsigned char>(s[s.size() - 2]))) {
        s.pop_back();
    }

    uint64_t multiplier = 1;
    switch (s.back()) {
        case 'b': multiplier = 1; s.pop_back(); break;
        case 'k': multiplier = 1024ULL; s.pop_back(); break;
        case 'm': multiplier = 1024ULL * 1024; s.pop_back(); break;
        case 'g': multiplier = 1024ULL * 1024 * 1024; s.pop_back(); break;
        default: break;
    }

    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    try {
        uint64_t value = std::stoull(s);
        if (value == 0) return std::nullopt;
        if (value > UINT64_MAX / multiplier) return std::nullopt;
        return value * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_memory_size(uint64_t bytes) {
    constexpr uint64_t KIB = 1024ULL;
    constexpr uint64_t MIB = KIB * 1024;
    constexpr uint64_t GIB = MIB * 1024;

    if (bytes != 0 && bytes % GIB == 0) return std::to_string(bytes / GIB) + "g";
    if (bytes != 0 && bytes % MIB == 0) return std::to_string(bytes / MIB) + "m";
    if (bytes != 0 && bytes % KIB == 0) return std::to_string(bytes / KIB) + "k";
    return std::to_string(bytes);
}

std::optional<bool> parse_bool(const std::string& text) {
    std::string s = to_lower(trim(text));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

// ============================================================================
// Settings
// ============================================================================

void Settings::apply_env() {
    env_seconds("RUNBOX_TIMEOUT", process_timeout);
    env_seconds("RUNBOX_RESOURCE_TIMEOUT", resource_limited_timeout);
    env_seconds("RUNBOX_CONTAINER_TIMEOUT", container_timeout);
    env_size("RUNBOX_MEMORY_LIMIT", memory_limit_bytes);
    env_size("RUNBOX_CONTAINER_MEMORY_LIMIT", container_memory_limit_bytes);
    env_flag("RUNBOX_SECURITY_SCREEN", security_screen_enabled);
    env_flag("RUNBOX_NETWORK_ENABLED", network_enabled);

    if (auto raw = env("RUNBOX_KILL_GRACE_MS")) {
        auto value = parse_integer(*raw);
        if (value && *value >= 0) {
            kill_grace = std::chrono::milliseconds(*value);
        } else {
            spdlog::warn("Ignoring RUNBOX_KILL_GRACE_MS={}: expected milliseconds", *raw);
        }
    }

    env_positive("RUNBOX_MAX_OUTPUT_BYTES", max_output_bytes);
    env_string("RUNBOX_CONTAINER_USER", container_user);
    env_string("RUNBOX_DOCKER", docker_binary);
    env_string("RUNBOX_LANGUAGES_FILE", languages_file);
    env_string("RUNBOX_LOG_LEVEL", log_level);
    env_string("RUNBOX_LOG_FILE", log_file);
}

Settings Settings::from_env() {
    load_dotenv();
    Settings settings;
    settings.apply_env();
    return settings;
}

Settings Settings::from_json(const nlohmann::json& j) {
    return from_json(j, Settings{});
}

Settings Settings::from_json(const nlohmann::json& j, const Settings& base) {
    Settings s = base;

    json_seconds(j, "timeout", s.process_timeout);
    json_seconds(j, "resource_limited_timeout", s.resource_limited_timeout);
    json_seconds(j, "container_timeout", s.container_timeout);

    if (j.contains("memory_limit")) {
        s.memory_limit_bytes = json_size(j["memory_limit"], s.memory_limit_bytes, "memory_limit");
    }
    if (j.contains("container_memory_limit")) {
        s.container_memory_limit_bytes = json_size(j["container_memory_limit"],
                                                   s.container_memory_limit_bytes,
                                                   "container_memory_limit");
    }

    if (j.contains("security_screen")) s.security_screen_enabled = j["security_screen"].get<bool>();
    if (j.contains("network_enabled")) s.network_enabled = j["network_enabled"].get<bool>();
    if (j.contains("kill_grace_ms")) {
        if (j["kill_grace_ms"].is_number_integer() && j["kill_grace_ms"].get<int64_t>() >= 0) {
            s.kill_grace = std::chrono::milliseconds(j["kill_grace_ms"].get<int64_t>());
        } else {
            spdlog::warn("Ignoring settings key kill_grace_ms: expected non-negative milliseconds");
        }
    }
    if (j.contains("max_output_bytes")) {
        if (j["max_output_bytes"].is_number_integer() && j["max_output_bytes"].get<int64_t>() > 0) {
            s.max_output_bytes = j["max_output_bytes"].get<size_t>();
        } else {
            spdlog::warn("Ignoring settings key max_output_bytes: expected a positive integer");
        }
    }

    if (j.contains("container")) {
        auto& c = j["container"];
        if (c.contains("user")) s.container_user = c["user"].get<std::string>();
        if (c.contains("pids_limit")) s.container_pids_limit = c["pids_limit"].get<int64_t>();
        if (c.contains("docker")) s.docker_binary = c["docker"].get<std::string>();
    }

    if (j.contains("languages_file")) s.languages_file = j["languages_file"].get<std::string>();

    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) s.log_level = l["level"].get<std::string>();
        if (l.contains("file")) s.log_file = l["file"].get<std::string>();
    }

    return s;
}

nlohmann::json Settings::to_json() const {
    nlohmann::json j;

    j["timeout"] = to_seconds(process_timeout);
    j["resource_limited_timeout"] = to_seconds(resource_limited_timeout);
    j["container_timeout"] = to_seconds(container_timeout);
    j["memory_limit"] = format_memory_size(memory_limit_bytes);
    j["container_memory_limit"] = format_memory_size(container_memory_limit_bytes);
    j["security_screen"] = security_screen_enabled;
    j["network_enabled"] = network_enabled;
    j["kill_grace_ms"] = kill_grace.count();
    j["max_output_bytes"] = max_output_bytes;

    j["container"]["user"] = container_user;
    j["container"]["pids_limit"] = container_pids_limit;
    j["container"]["docker"] = docker_binary;

    j["languages_file"] = languages_file;
    j["logging"]["level"] = log_level;
    j["logging"]["file"] = log_file;

    return j;
}

bool Settings::load_file(const std::string& path, Settings* out, std::string* error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error_msg) *error_msg = "cannot open " + path;
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        *out = from_json(j, *out);
    } catch (const std::exception& e) {
        if (error_msg) *error_msg = path + ": " + e.what();
        return false;
    }

    spdlog::debug("Loaded settings from {}", path);
    return true;
}

} // namespace runbox::util
