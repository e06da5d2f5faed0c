#include <gtest/gtest.h>
#include "security_validator.h"
#include "language_registry.h"
#include "errors.h"

namespace gradebox {
namespace {

class SecurityValidatorTest : public ::testing::Test {
protected:
    SecurityValidator validator;
    LanguageProfile python = BuiltInLanguages::python();
    LanguageProfile cpp = BuiltInLanguages::cpp();
};

// ============================================================================
// Path Safety
// ============================================================================

TEST_F(SecurityValidatorTest, AcceptsPlainRelativePaths) {
    auto result = validator.validate({{"solution.py", "def f():\n    return 1\n"},
                                      {"pkg/helpers.py", "X = 2\n"}}, python);
    EXPECT_TRUE(result.ok) << result.reason;
}

TEST_F(SecurityValidatorTest, RejectsTraversalAndAbsolutePaths) {
    for (const std::string& path : {"../escape.py", "a/../../b.py", "/etc/passwd", "~/x.py",
                                    "./a.py", "a//b.py", "a\\b.py", ""}) {
        auto result = validator.validate({{path, "x = 1"}}, python);
        EXPECT_FALSE(result.ok) << "Path should be rejected: '" << path << "'";
        EXPECT_NE(result.reason.find("Invalid file path"), std::string::npos);
    }
}

TEST_F(SecurityValidatorTest, RejectsControlCharactersInPaths) {
    auto result = validator.validate({{std::string("a\nb.py"), "x = 1"}}, python);
    EXPECT_FALSE(result.ok);
}

TEST_F(SecurityValidatorTest, RejectsReportDirectory) {
    auto result = validator.validate({{".gradebox/report.xml", "<testsuite/>"}}, python);
    EXPECT_FALSE(result.ok) << "Submissions cannot plant their own test report";
}

TEST_F(SecurityValidatorTest, RejectsReservedProblemPaths) {
    std::set<std::string> reserved = {"tests/", "Makefile"};

    EXPECT_FALSE(validator.validate({{"tests/test_solution.py", "def test(): pass"}}, python, reserved).ok);
    EXPECT_FALSE(validator.validate({{"Makefile", "all:"}}, python, reserved).ok);
    EXPECT_TRUE(validator.validate({{"testsuite.py", "X = 1"}}, python, reserved).ok)
        << "Directory reservation must not match a mere prefix of a file name";
}

TEST_F(SecurityValidatorTest, RejectsRunnerConfiguration) {
    auto result = validator.validate({{"conftest.py", "import pytest"}}, python);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.reason.find("conftest.py"), std::string::npos);
}

// ============================================================================
// Payload Limits
// ============================================================================

TEST_F(SecurityValidatorTest, RejectsEmptySubmission) {
    EXPECT_FALSE(validator.validate({}, python).ok);
}

TEST_F(SecurityValidatorTest, RejectsOversizedPayload) {
    ValidatorLimits limits;
    limits.max_payload_bytes = 100;
    SecurityValidator small(limits);

    EXPECT_TRUE(small.validate({{"a.txt", std::string(60, 'a')}}, python).ok);
    auto result = small.validate({{"a.txt", std::string(60, 'a')}, {"b.txt", std::string(60, 'b')}}, python);
    EXPECT_FALSE(result.ok) << "Size limit applies to the aggregate, not per file";
    EXPECT_NE(result.reason.find("too large"), std::string::npos);
}

TEST_F(SecurityValidatorTest, RejectsTooManyFiles) {
    ValidatorLimits limits;
    limits.max_files = 2;
    SecurityValidator small(limits);

    FileMap files = {{"a.py", ""}, {"b.py", ""}, {"c.py", ""}};
    EXPECT_FALSE(small.validate(files, python).ok);
}

TEST_F(SecurityValidatorTest, PathChecksRunBeforeSizeChecks) {
    ValidatorLimits limits;
    limits.max_payload_bytes = 10;
    SecurityValidator small(limits);

    auto result = small.validate({{"../x.py", std::string(100, 'a')}}, python);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.reason.find("Invalid file path"), std::string::npos);
}

// ============================================================================
// Source Denylist
// ============================================================================

TEST_F(SecurityValidatorTest, PythonDenylist) {
    EXPECT_FALSE(validator.validate({{"s.py", "import subprocess\n"}}, python).ok);
    EXPECT_FALSE(validator.validate({{"s.py", "os.system('ls')\n"}}, python).ok);
    EXPECT_FALSE(validator.validate({{"s.py", "eval(input())\n"}}, python).ok);
    EXPECT_FALSE(validator.validate({{"s.py", "__import__('os')\n"}}, python).ok);
    EXPECT_TRUE(validator.validate({{"s.py", "def evaluate(x):\n    return x.eval_score()\n"}}, python).ok)
        << "Identifiers containing 'eval' are not dynamic execution";
}

TEST_F(SecurityValidatorTest, DenylistOnlyScreensSourceExtensions) {
    EXPECT_TRUE(validator.validate({{"notes.txt", "subprocess is banned in code"}}, python).ok);
}

TEST_F(SecurityValidatorTest, CppDenylist) {
    EXPECT_FALSE(validator.validate({{"main.cpp", "int main() { system(\"ls\"); }"}}, cpp).ok);
    EXPECT_FALSE(validator.validate({{"main.cpp", "#include <sys/ptrace.h>\n"}}, cpp).ok);
    EXPECT_TRUE(validator.validate({{"main.cpp", "int main() { return filesystem_size(); }"}}, cpp).ok);
}

TEST_F(SecurityValidatorTest, DenylistMatchesAtLineStart) {
    EXPECT_FALSE(validator.validate({{"s.py", "x = 1\neval('2')\n"}}, python).ok)
        << "A later line starting with eval( is screened too";
}

TEST_F(SecurityValidatorTest, RejectsOverlongLineWithoutScanningIt) {
    // A long whitespace run after a denied call used to exhaust the stack
    std::string content = "import os\nos.system" + std::string(300000, ' ') + "x\n";

    ValidationResult result = validator.validate({{"s.py", content}}, python);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.reason.find("Line 2 of s.py is longer than"), std::string::npos) << result.reason;
}

TEST_F(SecurityValidatorTest, LongLinesOutsideScreenedFilesAreAllowed) {
    std::string data(300000, 'a');
    EXPECT_TRUE(validator.validate({{"data.txt", data}, {"s.py", "x = 1\n"}}, python).ok);
}

TEST_F(SecurityValidatorTest, LineLimitIsConfigurable) {
    ValidatorLimits limits;
    limits.max_line_length = 8;
    SecurityValidator strict(limits);

    EXPECT_TRUE(strict.validate({{"s.py", "x = 1\ny = 2\n"}}, python).ok);
    EXPECT_FALSE(strict.validate({{"s.py", "total = 12345\n"}}, python).ok);
}

TEST_F(SecurityValidatorTest, InvalidPatternIsConfigError) {
    LanguageProfile broken = python;
    broken.name = "broken";
    broken.denied_patterns = {"(unclosed"};
    EXPECT_THROW(validator.validate({{"a.py", "x"}}, broken), ConfigError);
}

TEST_F(SecurityValidatorTest, PatternCacheFollowsProfileChanges) {
    LanguageProfile custom = python;
    custom.name = "custom";
    custom.denied_patterns = {"forbidden"};
    EXPECT_FALSE(validator.validate({{"a.py", "forbidden"}}, custom).ok);

    custom.denied_patterns = {"other"};
    EXPECT_TRUE(validator.validate({{"a.py", "forbidden"}}, custom).ok);
}

} // namespace
} // namespace gradebox
