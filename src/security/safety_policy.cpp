#include "security/safety_policy.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace runbox::security {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(s);
    while (std::getline(stream, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

// "os.path as p" -> "os", "'fs/promises'" -> "fs", "node:child_process" -> "child_process"
std::string top_level_module(const std::string& raw) {
    std::string s = trim(raw);
    if (!s.empty() && (s.front() == '"' || s.front() == '\'')) {
        s = s.substr(1);
    }

    std::string token;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/' ||
            c == '@' || c == ':' || c == '-') {
            token += c;
        } else {
            break;
        }
    }

    if (token.rfind("node:", 0) == 0) {
        token = token.substr(5);
    }
    size_t cut = token.find_first_of("./");
    if (cut == 0) {
        return "";  // relative import
    }
    if (cut != std::string::npos) {
        token = token.substr(0, cut);
    }
    return token;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return {};
    return j[key].get<std::vector<std::string>>();
}

} // namespace

// ============================================================================
// LanguageRules
// ============================================================================

LanguageRules LanguageRules::from_json(const nlohmann::json& j) {
    LanguageRules rules;
    rules.blocked_keywords = string_list(j, "keywords");
    rules.blocked_modules = string_list(j, "modules");
    rules.allowed_modules = string_list(j, "allowed_modules");
    rules.import_patterns = string_list(j, "import_patterns");
    rules.blocked_patterns = string_list(j, "patterns");
    return rules;
}

nlohmann::json LanguageRules::to_json() const {
    nlohmann::json j;
    j["keywords"] = blocked_keywords;
    j["modules"] = blocked_modules;
    j["allowed_modules"] = allowed_modules;
    j["import_patterns"] = import_patterns;
    j["patterns"] = blocked_patterns;
    return j;
}

// ============================================================================
// Built-in rule sets
// ============================================================================

LanguageRules CodeValidator::python_rules() {
    LanguageRules r;
    r.blocked_keywords = {
        "os.system", "os.popen", "os.exec", "os.spawn", "os.fork", "subprocess",
        "__import__", "__builtins__", "__subclasses__", "__globals__", "__code__",
        "ctypes", "importlib", "pickle.loads", "marshal.loads",
    };
    r.blocked_modules = {
        "os", "sys", "subprocess", "socket", "urllib", "urllib2", "urllib3", "requests",
        "http", "httplib", "ftplib", "smtplib", "telnetlib", "multiprocessing", "threading",
        "_thread", "ctypes", "pickle", "marshal", "shelve", "dbm", "sqlite3", "webbrowser",
        "platform", "getpass", "importlib", "shutil", "pathlib", "signal", "pty", "resource",
        "tempfile", "io", "builtins",
    };
    r.allowed_modules = {
        "math", "cmath", "random", "datetime", "time", "calendar", "json", "csv", "base64",
        "hashlib", "hmac", "string", "re", "collections", "itertools", "functools",
        "operator", "copy", "pprint", "textwrap", "decimal", "fractions", "statistics",
        "heapq", "bisect", "dataclasses", "typing", "enum", "abc", "array", "numbers",
        "uuid", "unicodedata",
    };
    r.import_patterns = {
        R"(^\s*import\s+(.+)$)",
        R"(^\s*from\s+([\w\.]+)\s+import\b)",
    };
    r.blocked_patterns = {
        R"((^|[^.\w])(eval|exec|compile|open|breakpoint|globals|locals|vars)\s*\()",
        R"((^|[^.\w])(getattr|setattr|delattr)\s*\()",
    };
    return r;
}

LanguageRules CodeValidator::javascript_rules() {
    LanguageRules r;
    r.blocked_keywords = {
        "child_process", "process.binding", "process.dlopen", "process.kill",
        "worker_threads", "require.main",
    };
    r.blocked_modules = {
        "child_process", "fs", "net", "http", "https", "http2", "dgram", "dns", "tls",
        "cluster", "worker_threads", "vm", "os", "v8", "inspector", "module",
    };
    r.import_patterns = {
        R"(require\s*\(\s*['"]([^'"]+)['"])",
        R"(\bfrom\s+['"]([^'"]+)['"])",
        R"(^\s*import\s+['"]([^'"]+)['"])",
        R"(\bimport\s*\(\s*['"]([^'"]+)['"])",
    };
    r.blocked_patterns = {
        R"((^|[^.\w])(eval|Function)\s*\()",
        R"(\bimport\s*\(\s*[^'"\s])",
    };
    return r;
}

LanguageRules CodeValidator::java_rules() {
    LanguageRules r;
    r.blocked_keywords = {
        "Runtime.getRuntime", "ProcessBuilder", "java.net.", "java.nio.file", "java.io.File",
        "System.exit", "java.lang.reflect", "ClassLoader", "sun.misc.Unsafe",
    };
    return r;
}

LanguageRules CodeValidator::shell_rules() {
    LanguageRules r;
    r.blocked_keywords = DEFAULT_BLOCKED_COMMANDS;
    r.blocked_patterns = {
        R"((^|[;&|(\s])(curl|wget|nc|ncat|ssh|scp|telnet)(\s|$))",
    };
    return r;
}

// ============================================================================
// CodeValidator
// ============================================================================

CodeValidator::CodeValidator()
    : CodeValidator(std::unordered_map<std::string, LanguageRules>{
          {"python", python_rules()},
          {"javascript", javascript_rules()},
          {"java", java_rules()},
          {"shell", shell_rules()},
      }) {}

CodeValidator::CodeValidator(std::unordered_map<std::string, LanguageRules> rules) {
    for (auto& [language, set] : rules) {
        rules_.emplace(language, compile(set));
    }
}

CodeValidator::CompiledRules CodeValidator::compile(const LanguageRules& rules) {
    CompiledRules compiled;
    compiled.rules = rules;
    for (const auto& p : rules.import_patterns) {
        compiled.imports.emplace_back(p);
    }
    for (const auto& p : rules.blocked_patterns) {
        compiled.patterns.emplace_back(p);
    }
    return compiled;
}

std::vector<std::string> CodeValidator::imported_modules(const std::string& code,
                                                         const std::vector<std::regex>& patterns) {
    std::vector<std::string> modules;
    if (patterns.empty()) return modules;

    for (const auto& line : split(code, '\n')) {
        if (line.size() > MAX_SCREENED_LINE) continue;
        for (const auto& statement : split(line, ';')) {
            for (const auto& re : patterns) {
                auto begin = std::sregex_iterator(statement.begin(), statement.end(), re);
                for (auto it = begin; it != std::sregex_iterator(); ++it) {
                    if (it->size() < 2) continue;
                    // "import a, b as c" names several modules
                    for (const auto& item : split((*it)[1].str(), ',')) {
                        std::string module = top_level_module(item);
                        if (!module.empty()) {
                            modules.push_back(module);
                        }
                    }
                }
            }
        }
    }
    return modules;
}

Verdict CodeValidator::check(const std::string& code, const std::string& language) const {
    auto it = rules_.find(language);
    if (it == rules_.end()) {
        return Verdict::allow();
    }
    const CompiledRules& compiled = it->second;

    for (const auto& keyword : compiled.rules.blocked_keywords) {
        if (code.find(keyword) != std::string::npos) {
            return Verdict::deny("keyword", "dangerous keyword '" + keyword + "'");
        }
    }

    // std::regex recursion depth grows with the input, so regex rules only see bounded lines
    const bool has_regex_rules = !compiled.imports.empty() || !compiled.patterns.empty();
    const std::vector<std::string> lines = split(code, '\n');
    if (has_regex_rules) {
        for (size_t n = 0; n < lines.size(); n++) {
            if (lines[n].size() > MAX_SCREENED_LINE) {
                return Verdict::deny("length", fmt::format("line {} is longer than {} characters",
                                                           n + 1, MAX_SCREENED_LINE));
            }
        }
    }

    for (const auto& module : imported_modules(code, compiled.imports)) {
        if (contains(compiled.rules.blocked_modules, module)) {
            return Verdict::deny("module", "dangerous module import '" + module + "'");
        }
        if (!compiled.rules.allowed_modules.empty() &&
            !contains(compiled.rules.allowed_modules, module)) {
            return Verdict::deny("allowlist", "module '" + module + "' is not on the import allow-list");
        }
    }

    for (const auto& line : lines) {
        for (size_t i = 0; i < compiled.patterns.size(); i++) {
            if (std::regex_search(line, compiled.patterns[i])) {
                return Verdict::deny("pattern", "dangerous pattern /" + compiled.rules.blocked_patterns[i] + "/");
            }
        }
    }

    return Verdict::allow();
}

bool CodeValidator::has_rules_for(const std::string& language) const {
    return rules_.count(language) > 0;
}

nlohmann::json CodeValidator::describe() const {
    nlohmann::json j;
    j["policy"] = name();
    j["languages"] = nlohmann::json::object();
    for (const auto& [language, compiled] : rules_) {
        j["languages"][language] = {
            {"keywords", compiled.rules.blocked_keywords.size()},
            {"modules", compiled.rules.blocked_modules.size()},
            {"allowed_modules", compiled.rules.allowed_modules.size()},
            {"patterns", compiled.rules.blocked_patterns.size()},
        };
    }
    return j;
}

CodeValidator CodeValidator::from_json(const nlohmann::json& j) {
    std::unordered_map<std::string, LanguageRules> rules = {
        {"python", python_rules()},
        {"javascript", javascript_rules()},
        {"java", java_rules()},
        {"shell", shell_rules()},
    };
    for (auto it = j.begin(); it != j.end(); ++it) {
        rules[it.key()] = LanguageRules::from_json(it.value());
    }
    return CodeValidator(std::move(rules));
}

nlohmann::json CodeValidator::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [language, compiled] : rules_) {
        j[language] = compiled.rules.to_json();
    }
    return j;
}

// ============================================================================
// Policy selection
// ============================================================================

nlohmann::json DeferToIsolationPolicy::describe() const {
    return nlohmann::json{{"policy", name()}};
}

std::shared_ptr<const SafetyPolicy> make_safety_policy(bool screen_enabled) {
    if (screen_enabled) {
        return std::make_shared<CodeValidator>();
    }
    spdlog::debug("Security screen disabled, deferring to isolation");
    return std::make_shared<DeferToIsolationPolicy>();
}

} // namespace runbox::security
