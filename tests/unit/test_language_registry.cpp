#include <gtest/gtest.h>
#include "language_registry.h"

#include <algorithm>

namespace gradebox {
namespace {

TEST(LanguageRegistryTest, BuiltInLanguagesAreRegistered) {
    LanguageRegistry registry;
    auto names = registry.list_languages();

    for (const std::string& name : {"python", "java", "javascript", "cpp"}) {
        EXPECT_TRUE(registry.has_language(name)) << name;
        EXPECT_NE(std::find(names.begin(), names.end(), name), names.end());
    }
    EXPECT_FALSE(registry.has_language("cobol"));
    EXPECT_FALSE(registry.find("cobol").has_value());
}

TEST(LanguageRegistryTest, BuiltInProfilesAreComplete) {
    LanguageRegistry registry;
    for (const auto& name : registry.list_languages()) {
        auto profile = registry.find(name);
        ASSERT_TRUE(profile.has_value());
        EXPECT_EQ(profile->name, name);
        EXPECT_FALSE(profile->image.empty()) << name;
        EXPECT_FALSE(profile->dockerfile.empty()) << name;
        EXPECT_FALSE(profile->command.empty()) << name;
        EXPECT_FALSE(profile->extensions.empty()) << name;
        if (profile->report_format != ReportFormat::STDOUT) {
            EXPECT_FALSE(profile->report_pattern.empty()) << name << " needs a report location";
        }
    }
}

TEST(LanguageRegistryTest, PythonWritesJUnitIntoReportDirectory) {
    auto python = BuiltInLanguages::python();
    EXPECT_EQ(python.report_format, ReportFormat::JUNIT_XML);
    EXPECT_EQ(python.report_pattern.rfind(".gradebox/", 0), 0u);
    EXPECT_NE(python.command.find("--junitxml=" + python.report_pattern), std::string::npos);
}

TEST(LanguageRegistryTest, RegisterReplacesProfile) {
    LanguageRegistry registry;
    LanguageProfile custom = BuiltInLanguages::python();
    custom.image = "registry.local/python:3.12";
    registry.register_language(custom);

    EXPECT_EQ(registry.find("python")->image, "registry.local/python:3.12");

    LanguageProfile rust;
    rust.name = "rust";
    rust.image = "rust:1";
    rust.command = "cargo test";
    registry.register_language(rust);
    EXPECT_TRUE(registry.has_language("rust"));
}

TEST(LanguageRegistryTest, ReportFormatNames) {
    for (auto format : {ReportFormat::JUNIT_XML, ReportFormat::JSON_REPORT, ReportFormat::STDOUT}) {
        auto parsed = report_format_from_string(report_format_to_string(format));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, format);
    }
    EXPECT_FALSE(report_format_from_string("xml").has_value());
}

} // namespace
} // namespace gradebox
