#include <gtest/gtest.h>
#include "security/safety_policy.hpp"

namespace runbox::security {
namespace {

class CodeValidatorTest : public ::testing::Test {
protected:
    CodeValidator validator;

    bool allowed(const std::string& code, const std::string& language = "python") {
        return validator.validate(code, language).allowed;
    }
};

TEST_F(CodeValidatorTest, PlainPythonPasses) {
    EXPECT_TRUE(allowed("print(1+1)"));
    EXPECT_TRUE(allowed("def f(x):\n    return x * 2\nprint(f(21))"));
    EXPECT_TRUE(allowed("1/0"));
}

TEST_F(CodeValidatorTest, AllowListedImportsPass) {
    EXPECT_TRUE(allowed("import math\nprint(math.sqrt(16))"));
    EXPECT_TRUE(allowed("from collections import Counter"));
    EXPECT_TRUE(allowed("import time; time.sleep(0.1)"));
    EXPECT_TRUE(allowed("import json, re\nprint(re.compile('a+').match('aa'))"));
}

TEST_F(CodeValidatorTest, DangerousImportsAreRejected) {
    Verdict v = validator.validate("import os\nos.listdir('/')", "python");
    EXPECT_FALSE(v.allowed);
    EXPECT_EQ(v.rule, "module");
    EXPECT_NE(v.reason.find("'os'"), std::string::npos);

    EXPECT_FALSE(allowed("from socket import socket"));
    EXPECT_FALSE(allowed("import math, subprocess"));
    EXPECT_FALSE(allowed("import os.path as p"));
}

TEST_F(CodeValidatorTest, ImportsOutsideAllowListAreRejected) {
    Verdict v = validator.validate("import numpy", "python");
    EXPECT_FALSE(v.allowed);
    EXPECT_EQ(v.rule, "allowlist");
}

TEST_F(CodeValidatorTest, DangerousCallsAreRejected) {
    EXPECT_FALSE(allowed("eval('1+1')"));
    EXPECT_FALSE(allowed("x = exec ('print(1)')"));
    EXPECT_FALSE(allowed("open('/etc/passwd').read()"));
    EXPECT_FALSE(allowed("__import__('os').system('id')"));
    EXPECT_FALSE(allowed("getattr(object, 'x')"));
    EXPECT_FALSE(allowed("().__class__.__bases__[0].__subclasses__()"));
}

TEST_F(CodeValidatorTest, JavaScriptRules) {
    EXPECT_TRUE(allowed("console.log([1,2,3].map(x => x * 2))", "javascript"));
    EXPECT_FALSE(allowed("const fs = require('fs')", "javascript"));
    EXPECT_FALSE(allowed("import { readFileSync } from \"node:fs\"", "javascript"));
    EXPECT_FALSE(allowed("require('child_process').execSync('id')", "javascript"));
    EXPECT_FALSE(allowed("eval('2+2')", "javascript"));
    EXPECT_TRUE(allowed("function eval2() { return 1 }\nconsole.log(eval2())", "javascript"));
}

TEST_F(CodeValidatorTest, ShellRules) {
    EXPECT_TRUE(allowed("echo hello", "shell"));
    EXPECT_TRUE(allowed("for i in 1 2 3; do echo $i; done", "shell"));
    EXPECT_FALSE(allowed("sudo ls", "shell"));
    EXPECT_FALSE(allowed("rm -rf /", "shell"));
    EXPECT_FALSE(allowed("curl http://example.com", "shell"));
    EXPECT_FALSE(allowed("echo x > /dev/tcp/10.0.0.1/80", "shell"));
}

TEST_F(CodeValidatorTest, LanguagesWithoutRulesPass) {
    EXPECT_FALSE(validator.has_rules_for("go"));
    EXPECT_TRUE(allowed("package main\nimport \"os/exec\"", "go"));
}

TEST_F(CodeValidatorTest, OverlongImportLineIsRejectedWithoutCrashing) {
    std::string code = "import math";
    for (int i = 0; i < 20000; i++) code += ", math";

    Verdict verdict = validator.validate(code, "python");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.rule, "length");
    EXPECT_NE(verdict.reason.find("line 1"), std::string::npos);
}

TEST_F(CodeValidatorTest, OverlongRequireLiteralIsRejectedWithoutCrashing) {
    std::string code = "const m = require('" + std::string(300000, 'a') + "')";

    Verdict verdict = validator.validate(code, "javascript");
    EXPECT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.rule, "length");
}

TEST_F(CodeValidatorTest, LongProgramsOfShortLinesStillScreen) {
    std::string code;
    for (int i = 0; i < 20000; i++) code += "x = " + std::to_string(i) + "\n";
    EXPECT_TRUE(allowed(code));
    EXPECT_FALSE(allowed(code + "import socket\n"));

    std::string line(CodeValidator::MAX_SCREENED_LINE, ' ');
    EXPECT_TRUE(allowed("x = 1" + line.substr(5)));
}

TEST_F(CodeValidatorTest, LanguagesWithoutRegexRulesSkipLengthCheck) {
    EXPECT_TRUE(allowed("class A {}" + std::string(100000, ' '), "java"));
}

TEST(CodeValidatorJsonTest, OverridesReplaceOneLanguage) {
    nlohmann::json j = {{"python", {{"keywords", {"forbidden_word"}}}}};
    CodeValidator validator = CodeValidator::from_json(j);

    EXPECT_FALSE(validator.validate("forbidden_word = 1", "python").allowed);
    // Python's built-in module rules were replaced
    EXPECT_TRUE(validator.validate("import os", "python").allowed);
    // Shell rules are untouched
    EXPECT_FALSE(validator.validate("sudo id", "shell").allowed);

    nlohmann::json dumped = validator.to_json();
    EXPECT_EQ(dumped["python"]["keywords"][0], "forbidden_word");
}

TEST(CodeValidatorJsonTest, DescribeCountsRules) {
    CodeValidator validator;
    nlohmann::json d = validator.describe();
    EXPECT_EQ(d["policy"], "deny_list");
    EXPECT_GT(d["languages"]["python"]["modules"].get<int>(), 0);
    EXPECT_GT(d["languages"]["shell"]["keywords"].get<int>(), 0);
}

TEST(SafetyPolicyTest, DeferToIsolationAllowsEverything) {
    DeferToIsolationPolicy policy;
    EXPECT_TRUE(policy.check("import os; os.system('id')", "python").allowed);
    EXPECT_EQ(policy.name(), "defer_to_isolation");
}

TEST(SafetyPolicyTest, FactorySelectsPolicy) {
    EXPECT_EQ(make_safety_policy(true)->name(), "deny_list");
    EXPECT_EQ(make_safety_policy(false)->name(), "defer_to_isolation");
}

} // namespace
} // namespace runbox::security
