/**
 * Pre-execution safety screening.
 *
 * CodeValidator is a best-effort deny-list heuristic. It only gates the
 * resource-limited backend and is not a sandbox: code that passes it is not
 * proven safe. Real isolation comes from the container backend.
 */
#pragma once
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace runbox::security {

struct Verdict {
    bool allowed = true;
    std::string rule;     // which rule fired ("keyword", "module", "allowlist", "pattern", "length")
    std::string reason;

    static Verdict allow() { return Verdict{}; }
    static Verdict deny(std::string rule, std::string reason) {
        return Verdict{false, std::move(rule), std::move(reason)};
    }
};

class SafetyPolicy {
public:
    virtual ~SafetyPolicy() = default;

    virtual std::string name() const = 0;

    // language is the canonical profile id ("python", "shell", ...)
    virtual Verdict check(const std::string& code, const std::string& language) const = 0;

    virtual nlohmann::json describe() const = 0;
};

// Deny-list rules for one language
struct LanguageRules {
    std::vector<std::string> blocked_keywords;   // substring match
    std::vector<std::string> blocked_modules;    // top-level module names
    std::vector<std::string> allowed_modules;    // non-empty = only these may be imported
    std::vector<std::string> import_patterns;    // regex, group 1 = imported module list
    std::vector<std::string> blocked_patterns;   // regex

    static LanguageRules from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

class CodeValidator : public SafetyPolicy {
public:
    // Longest line the regex rules are run on; longer lines are rejected unscreened
    static constexpr size_t MAX_SCREENED_LINE = 4096;

    // Built-in rules for python, javascript, java and shell
    CodeValidator();
    explicit CodeValidator(std::unordered_map<std::string, LanguageRules> rules);

    std::string name() const override { return "deny_list"; }
    Verdict check(const std::string& code, const std::string& language) const override;
    nlohmann::json describe() const override;

    Verdict validate(const std::string& code, const std::string& language) const {
        return check(code, language);
    }

    bool has_rules_for(const std::string& language) const;

    // Languages present in j replace the built-in rules for that language
    static CodeValidator from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    static LanguageRules python_rules();
    static LanguageRules javascript_rules();
    static LanguageRules java_rules();
    static LanguageRules shell_rules();

private:
    struct CompiledRules {
        LanguageRules rules;
        std::vector<std::regex> imports;
        std::vector<std::regex> patterns;
    };

    std::unordered_map<std::string, CompiledRules> rules_;

    static CompiledRules compile(const LanguageRules& rules);
    static std::vector<std::string> imported_modules(const std::string& code,
                                                     const std::vector<std::regex>& patterns);
};

// No screening: isolation is left entirely to the backend
class DeferToIsolationPolicy : public SafetyPolicy {
public:
    std::string name() const override { return "defer_to_isolation"; }
    Verdict check(const std::string&, const std::string&) const override { return Verdict::allow(); }
    nlohmann::json describe() const override;
};

std::shared_ptr<const SafetyPolicy> make_safety_policy(bool screen_enabled);

// Destructive shell commands refused by the shell rules
const std::vector<std::string> DEFAULT_BLOCKED_COMMANDS = {
    "rm -rf /",
    "rm -rf ~",
    "rm -rf /*",
    "sudo",
    "su ",
    "chmod 777",
    "curl | bash",
    "wget | bash",
    "> /dev/sd",
    "dd if=",
    "mkfs",
    ":(){ :|:& };:",
    ":(){:|:&};:",
    "shutdown",
    "reboot",
    "init 0",
    "poweroff",
    "/dev/tcp/",
    "nc -e",
};

} // namespace runbox::security
