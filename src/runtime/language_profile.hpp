/**
 * Language profiles: how to materialize and run a snippet of a given language.
 *
 * The table is built once (built-in defaults or a JSON file) and is read-only
 * afterwards, so backends share it without locking.
 */
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace runbox::runtime {

struct LanguageProfile {
    std::string language;                       // canonical id, e.g. "python"
    std::string file_extension;                 // ".py"
    std::vector<std::string> run_command;       // argv template, {file} and {dir} placeholders
    std::optional<std::string> image_reference; // container image, absent = no container support
    std::vector<std::string> aliases;
    std::vector<std::pair<std::string, std::string>> environment;

    std::string source_filename() const { return "code" + file_extension; }

    std::vector<std::string> render_command(const std::string& file, const std::string& dir) const;
    std::vector<std::pair<std::string, std::string>> render_environment(const std::string& dir) const;

    static LanguageProfile from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

class LanguageTable {
public:
    LanguageTable() = default;
    explicit LanguageTable(std::vector<LanguageProfile> profiles);

    // Case-insensitive, accepts aliases. nullptr when unknown.
    const LanguageProfile* resolve(const std::string& language) const;
    bool supports(const std::string& language) const { return resolve(language) != nullptr; }

    std::vector<std::string> languages() const;
    const std::vector<LanguageProfile>& profiles() const { return profiles_; }
    bool empty() const { return profiles_.empty(); }

    static LanguageTable default_table();

    static LanguageTable from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
    static bool load_file(const std::string& path, LanguageTable* out, std::string* error_msg);

private:
    std::vector<LanguageProfile> profiles_;
    std::unordered_map<std::string, size_t> index_;

    void build_index();
};

} // namespace runbox::runtime
