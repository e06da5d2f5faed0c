#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <optional>

namespace gradebox {

// How a language's test runner reports results
enum class ReportFormat {
    JUNIT_XML,      // One or more JUnit XML files
    JSON_REPORT,    // {"tests": [...]} or pytest-json-report
    STDOUT          // PASS/FAIL markers, TAP or pytest summary on stdout
};

std::string report_format_to_string(ReportFormat format);
std::optional<ReportFormat> report_format_from_string(const std::string& name);

// Everything language-specific, so the sandbox stays language-agnostic
struct LanguageProfile {
    std::string name;                          // e.g., "python"
    std::string image;                         // Runtime image tag
    std::string dockerfile;                    // Used when the image is missing
    std::string command;                       // Shell command run in the workspace
    std::string report_pattern;                // Relative glob, empty for stdout
    ReportFormat report_format = ReportFormat::STDOUT;
    std::vector<std::string> extensions;       // Source extensions screened by the validator
    std::vector<std::string> denied_patterns;  // ECMAScript regexes
    std::vector<std::string> reserved_files;   // Runner config a submission may not supply
};

// Language name -> profile. Populated at startup, read by every worker.
class LanguageRegistry {
public:
    // Registry preloaded with the built-in languages
    LanguageRegistry();

    // Add or replace a profile
    void register_language(const LanguageProfile& profile);

    std::optional<LanguageProfile> find(const std::string& name) const;
    bool has_language(const std::string& name) const;
    std::vector<std::string> list_languages() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, LanguageProfile> profiles_;
};

// Built-in language profiles
namespace BuiltInLanguages {
    // pytest with JUnit XML output
    LanguageProfile python();

    // JUnit 5 console launcher with XML reports
    LanguageProfile java();

    // node --test with TAP on stdout
    LanguageProfile javascript();

    // g++ build of a harness printing PASS/FAIL lines
    LanguageProfile cpp();
}

} // namespace gradebox
