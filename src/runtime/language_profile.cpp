#include "runtime/language_profile.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace runbox::runtime {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string substitute(std::string text, const std::string& key, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
        text.replace(pos, key.size(), value);
        pos += value.size();
    }
    return text;
}

} // namespace

// ============================================================================
// LanguageProfile
// ============================================================================

std::vector<std::string> LanguageProfile::render_command(const std::string& file,
                                                         const std::string& dir) const {
    std::vector<std::string> argv;
    argv.reserve(run_command.size());
    for (const auto& part : run_command) {
        argv.push_back(substitute(substitute(part, "{file}", file), "{dir}", dir));
    }
    return argv;
}

std::vector<std::pair<std::string, std::string>>
LanguageProfile::render_environment(const std::string& dir) const {
    std::vector<std::pair<std::string, std::string>> env;
    for (const auto& [key, value] : environment) {
        env.emplace_back(key, substitute(value, "{dir}", dir));
    }
    return env;
}

LanguageProfile LanguageProfile::from_json(const nlohmann::json& j) {
    LanguageProfile p;
    p.language = lower(j.at("language").get<std::string>());
    p.file_extension = j.at("extension").get<std::string>();
    if (!p.file_extension.empty() && p.file_extension.front() != '.') {
        p.file_extension = "." + p.file_extension;
    }

    const auto& cmd = j.at("run_command");
    if (cmd.is_string()) {
        // "python3 {file}" -> split on spaces
        std::string word;
        for (char c : cmd.get<std::string>()) {
            if (c == ' ') {
                if (!word.empty()) p.run_command.push_back(word);
                word.clear();
            } else {
                word += c;
            }
        }
        if (!word.empty()) p.run_command.push_back(word);
    } else {
        p.run_command = cmd.get<std::vector<std::string>>();
    }
    if (p.run_command.empty()) {
        throw std::invalid_argument("language " + p.language + " has an empty run_command");
    }

    if (j.contains("image") && !j["image"].is_null()) {
        p.image_reference = j["image"].get<std::string>();
    }
    if (j.contains("aliases")) {
        for (const auto& a : j["aliases"]) {
            p.aliases.push_back(lower(a.get<std::string>()));
        }
    }
    if (j.contains("env")) {
        for (auto it = j["env"].begin(); it != j["env"].end(); ++it) {
            p.environment.emplace_back(it.key(), it.value().get<std::string>());
        }
    }
    return p;
}

nlohmann::json LanguageProfile::to_json() const {
    nlohmann::json j;
    j["language"] = language;
    j["extension"] = file_extension;
    j["run_command"] = run_command;
    j["image"] = image_reference ? nlohmann::json(*image_reference) : nlohmann::json(nullptr);
    j["aliases"] = aliases;
    j["env"] = nlohmann::json::object();
    for (const auto& [key, value] : environment) {
        j["env"][key] = value;
    }
    return j;
}

// ============================================================================
// LanguageTable
// ============================================================================

LanguageTable::LanguageTable(std::vector<LanguageProfile> profiles)
    : profiles_(std::move(profiles)) {
    build_index();
}

void LanguageTable::build_index() {
    index_.clear();
    for (size_t i = 0; i < profiles_.size(); i++) {
        index_[lower(profiles_[i].language)] = i;
    }
    // Aliases never shadow a canonical name
    for (size_t i = 0; i < profiles_.size(); i++) {
        for (const auto& alias : profiles_[i].aliases) {
            index_.emplace(lower(alias), i);
        }
    }
}

const LanguageProfile* LanguageTable::resolve(const std::string& language) const {
    auto it = index_.find(lower(language));
    if (it == index_.end()) {
        return nullptr;
    }
    return &profiles_[it->second];
}

std::vector<std::string> LanguageTable::languages() const {
    std::vector<std::string> names;
    for (const auto& p : profiles_) {
        names.push_back(p.language);
    }
    return names;
}

LanguageTable LanguageTable::default_table() {
    std::vector<LanguageProfile> profiles;

    LanguageProfile python;
    python.language = "python";
    python.file_extension = ".py";
    python.run_command = {"python3", "{file}"};
    python.image_reference = "python:3.9-slim";
    python.aliases = {"py", "python3"};
    python.environment = {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONUNBUFFERED", "1"}};
    profiles.push_back(python);

    LanguageProfile javascript;
    javascript.language = "javascript";
    javascript.file_extension = ".js";
    javascript.run_command = {"node", "{file}"};
    javascript.image_reference = "node:18-alpine";
    javascript.aliases = {"js", "node"};
    profiles.push_back(javascript);

    // Single-file source launch: nothing is compiled into the read-only mount
    LanguageProfile java;
    java.language = "java";
    java.file_extension = ".java";
    java.run_command = {"java", "{file}"};
    java.image_reference = "openjdk:11-jdk-slim";
    profiles.push_back(java);

    LanguageProfile go;
    go.language = "go";
    go.file_extension = ".go";
    go.run_command = {"go", "run", "{file}"};
    go.image_reference = "golang:1.19-alpine";
    go.aliases = {"golang"};
    go.environment = {{"GOCACHE", "/tmp/go-cache"}, {"GOPATH", "/tmp/go"}};
    profiles.push_back(go);

    LanguageProfile shell;
    shell.language = "shell";
    shell.file_extension = ".sh";
    shell.run_command = {"sh", "{file}"};
    shell.image_reference = "alpine:3.19";
    shell.aliases = {"sh", "bash"};
    profiles.push_back(shell);

    return LanguageTable(std::move(profiles));
}

LanguageTable LanguageTable::from_json(const nlohmann::json& j) {
    const auto& list = j.contains("languages") ? j["languages"] : j;
    if (!list.is_array()) {
        throw std::invalid_argument("language table must be an array of profiles");
    }

    std::vector<LanguageProfile> profiles;
    for (const auto& entry : list) {
        profiles.push_back(LanguageProfile::from_json(entry));
    }
    return LanguageTable(std::move(profiles));
}

nlohmann::json LanguageTable::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& p : profiles_) {
        list.push_back(p.to_json());
    }
    return nlohmann::json{{"languages", list}};
}

bool LanguageTable::load_file(const std::string& path, LanguageTable* out, std::string* error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error_msg) *error_msg = "cannot open " + path;
        return false;
    }

    try {
        *out = from_json(nlohmann::json::parse(file));
    } catch (const std::exception& e) {
        if (error_msg) *error_msg = path + ": " + e.what();
        return false;
    }

    spdlog::info("Loaded {} language profiles from {}", out->profiles().size(), path);
    return true;
}

} // namespace runbox::runtime
