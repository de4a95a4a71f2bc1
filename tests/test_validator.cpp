/**
 * @file test_validator.cpp
 * @brief Unit tests for CodeValidator import and operation policy checks.
 */
#include <gtest/gtest.h>
#include "config/config.hpp"
#include "exec/validator.hpp"

using codebox::config::default_validation_policy;
using codebox::config::ValidationPolicy;
using codebox::exec::CodeValidator;

class ValidatorTest : public ::testing::Test {
protected:
    CodeValidator validator{default_validation_policy()};
};

TEST_F(ValidatorTest, AllowedImportsPass) {
    auto result = validator.validate("import Lean\nimport Std.Data.HashMap\n\ndef main : IO Unit := IO.println \"hi\"\n");
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.reason.has_value());
}

TEST_F(ValidatorTest, CodeWithoutImportsPasses) {
    EXPECT_TRUE(validator.validate("def main : IO Unit := IO.println \"Hello, world!\"").valid);
}

TEST_F(ValidatorTest, BlockedImportRejected) {
    auto result = validator.validate("import System.IO.Process\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("System.IO.Process"), std::string::npos);
    EXPECT_NE(result.reason->find("blocked"), std::string::npos);
}

// A blocked namespace stays blocked even when listed alongside allowed ones
TEST_F(ValidatorTest, BlockedWinsOverAllowed) {
    ValidationPolicy policy = default_validation_policy();
    policy.allowed_namespaces.push_back("System");
    CodeValidator permissive(policy);

    auto result = permissive.validate("import Lean\nimport System.FilePath\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("System.FilePath"), std::string::npos);
}

TEST_F(ValidatorTest, NamespaceOutsideAllowListRejected) {
    auto result = validator.validate("import System.Command\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("not in the allowed list"), std::string::npos);
}

TEST_F(ValidatorTest, EmptyAllowListPermitsAnyUnblockedNamespace) {
    ValidationPolicy policy = default_validation_policy();
    policy.allowed_namespaces.clear();
    CodeValidator open(policy);

    EXPECT_TRUE(open.validate("import Aesop\n").valid);
    EXPECT_FALSE(open.validate("import System.IO.Process\n").valid);
}

TEST_F(ValidatorTest, DisallowedOperationRejected) {
    auto result = validator.validate("def main : IO Unit := do\n  let s <- IO.FS.readFile \"/etc/passwd\"\n  IO.println s\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("IO operation"), std::string::npos);
    EXPECT_NE(result.reason->find("IO.FS.readFile"), std::string::npos);
}

// The first violation in source order is the one reported
TEST_F(ValidatorTest, FirstViolationTopToBottom) {
    auto result = validator.validate(
        "def a := IO.Process.spawn\n"
        "def b := IO.FS.writeFile\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("IO.Process.spawn"), std::string::npos);

    result = validator.validate(
        "import System.Command\n"
        "import System.IO.Process\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("System.Command"), std::string::npos);
}

TEST_F(ValidatorTest, ImportsCheckedBeforeOperations) {
    auto result = validator.validate("def a := IO.FS.readFile\nimport System.FilePath\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("System.FilePath"), std::string::npos);
}

// A single enormous token must be rejected without running the patterns over it
TEST_F(ValidatorTest, OverlongLineRejected) {
    std::string code = "def main : IO Unit := IO.FS." + std::string(200000, 'a');
    auto result = validator.validate(code);
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("Line 1 exceeds the maximum length"), std::string::npos);

    result = validator.validate("def x := 1\n-- " + std::string(200000, 'b') + "\n");
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("Line 2"), std::string::npos);
}

TEST_F(ValidatorTest, LineAtLengthLimitStillScanned) {
    std::string line = "def s := \"" + std::string(CodeValidator::MAX_LINE_LENGTH - 11, 'c') + "\"";
    ASSERT_EQ(line.size(), CodeValidator::MAX_LINE_LENGTH);
    EXPECT_TRUE(validator.validate(line).valid);

    std::string flagged = "def s := IO.FS.readFile " + std::string(CodeValidator::MAX_LINE_LENGTH - 24, 'c');
    ASSERT_EQ(flagged.size(), CodeValidator::MAX_LINE_LENGTH);
    auto result = validator.validate(flagged);
    ASSERT_FALSE(result.valid);
    EXPECT_NE(result.reason->find("IO.FS.readFile"), std::string::npos);
}

TEST(ValidatorStaticTest, ExtractImportsSplitsNamespaces) {
    auto imports = CodeValidator::extract_imports(
        "-- header\n"
        "import Lean Std.Data -- trailing comment\n"
        "def x := 1\n"
        "  import Mathlib\n");
    ASSERT_EQ(imports.size(), 2u);
    EXPECT_EQ(imports[0].line, 2u);
    EXPECT_EQ(imports[0].namespaces, (std::vector<std::string>{"Lean", "Std.Data"}));
    EXPECT_EQ(imports[1].line, 4u);
    EXPECT_EQ(imports[1].namespaces, (std::vector<std::string>{"Mathlib"}));
}

TEST(ValidatorStaticTest, NamespaceMatchesOnDottedPrefix) {
    EXPECT_TRUE(CodeValidator::namespace_matches("Std", "Std"));
    EXPECT_TRUE(CodeValidator::namespace_matches("Std.Data.HashMap", "Std"));
    EXPECT_FALSE(CodeValidator::namespace_matches("StdX", "Std"));
    EXPECT_FALSE(CodeValidator::namespace_matches("Lean", "Lean.Elab"));
}
