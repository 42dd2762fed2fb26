#include <gtest/gtest.h>
#include "runtime/language_profile.hpp"

#include <filesystem>
#include <fstream>

namespace runbox::runtime {
namespace {

TEST(LanguageTableTest, ResolvesCanonicalNamesAndAliases) {
    LanguageTable table = LanguageTable::default_table();

    const LanguageProfile* python = table.resolve("python");
    ASSERT_NE(python, nullptr);
    EXPECT_EQ(python->file_extension, ".py");
    ASSERT_TRUE(python->image_reference.has_value());
    EXPECT_EQ(*python->image_reference, "python:3.9-slim");

    EXPECT_EQ(table.resolve("py"), python);
    EXPECT_EQ(table.resolve("Python3"), python);
    EXPECT_EQ(table.resolve("JS"), table.resolve("javascript"));
    EXPECT_EQ(table.resolve("bash"), table.resolve("shell"));
}

TEST(LanguageTableTest, UnknownLanguageIsNull) {
    LanguageTable table = LanguageTable::default_table();
    EXPECT_EQ(table.resolve("cobol"), nullptr);
    EXPECT_FALSE(table.supports(""));
}

TEST(LanguageTableTest, DefaultTableCoversFiveLanguages) {
    auto names = LanguageTable::default_table().languages();
    EXPECT_EQ(names, (std::vector<std::string>{"python", "javascript", "java", "go", "shell"}));
}

TEST(LanguageProfileTest, RendersPlaceholders) {
    LanguageProfile profile;
    profile.language = "go";
    profile.file_extension = ".go";
    profile.run_command = {"go", "run", "{file}"};
    profile.environment = {{"GOCACHE", "{dir}/.cache"}};

    EXPECT_EQ(profile.source_filename(), "code.go");
    EXPECT_EQ(profile.render_command("/w/code.go", "/w"),
              (std::vector<std::string>{"go", "run", "/w/code.go"}));

    auto env = profile.render_environment("/w");
    ASSERT_EQ(env.size(), 1u);
    EXPECT_EQ(env[0].second, "/w/.cache");
}

TEST(LanguageProfileTest, FromJsonAcceptsStringCommand) {
    nlohmann::json j = {
        {"language", "Ruby"},
        {"extension", "rb"},
        {"run_command", "ruby  {file}"},
        {"image", "ruby:3.2-alpine"},
        {"aliases", {"rb"}},
    };

    LanguageProfile p = LanguageProfile::from_json(j);
    EXPECT_EQ(p.language, "ruby");
    EXPECT_EQ(p.file_extension, ".rb");
    EXPECT_EQ(p.run_command, (std::vector<std::string>{"ruby", "{file}"}));
    EXPECT_EQ(p.image_reference.value_or(""), "ruby:3.2-alpine");
}

TEST(LanguageProfileTest, EmptyCommandIsRejected) {
    nlohmann::json j = {{"language", "x"}, {"extension", ".x"}, {"run_command", nlohmann::json::array()}};
    EXPECT_THROW(LanguageProfile::from_json(j), std::invalid_argument);
}

TEST(LanguageTableTest, JsonDumpLoadsBack) {
    LanguageTable original = LanguageTable::default_table();
    LanguageTable loaded = LanguageTable::from_json(original.to_json());

    ASSERT_EQ(loaded.profiles().size(), original.profiles().size());
    const LanguageProfile* go = loaded.resolve("golang");
    ASSERT_NE(go, nullptr);
    EXPECT_EQ(go->run_command, (std::vector<std::string>{"go", "run", "{file}"}));
}

TEST(LanguageTableTest, LoadFile) {
    auto path = std::filesystem::temp_directory_path() / "runbox_languages_test.json";
    {
        std::ofstream out(path);
        out << R"({"languages": [{"language": "lua", "extension": ".lua", "run_command": ["lua", "{file}"]}]})";
    }

    LanguageTable table;
    std::string error;
    ASSERT_TRUE(LanguageTable::load_file(path.string(), &table, &error)) << error;
    ASSERT_NE(table.resolve("lua"), nullptr);
    EXPECT_FALSE(table.resolve("lua")->image_reference.has_value());
    EXPECT_EQ(table.resolve("python"), nullptr);

    EXPECT_FALSE(LanguageTable::load_file("/nonexistent/languages.json", &table, &error));
    std::filesystem::remove(path);
}

} // namespace
} // namespace runbox::runtime
