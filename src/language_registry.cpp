#include "language_registry.h"

namespace gradebox {

std::string report_format_to_string(ReportFormat format) {
    switch (format) {
        case ReportFormat::JUNIT_XML: return "junit";
        case ReportFormat::JSON_REPORT: return "json";
        case ReportFormat::STDOUT: return "stdout";
    }
    return "stdout";
}

std::optional<ReportFormat> report_format_from_string(const std::string& name) {
    if (name == "junit") return ReportFormat::JUNIT_XML;
    if (name == "json") return ReportFormat::JSON_REPORT;
    if (name == "stdout") return ReportFormat::STDOUT;
    return std::nullopt;
}

LanguageRegistry::LanguageRegistry() {
    register_language(BuiltInLanguages::python());
    register_language(BuiltInLanguages::java());
    register_language(BuiltInLanguages::javascript());
    register_language(BuiltInLanguages::cpp());
}

void LanguageRegistry::register_language(const LanguageProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[profile.name] = profile;
}

std::optional<LanguageProfile> LanguageRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LanguageRegistry::has_language(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.count(name) > 0;
}

std::vector<std::string> LanguageRegistry::list_languages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : profiles_) {
        names.push_back(name);
    }
    return names;
}

// Built-in languages implementation

namespace BuiltInLanguages {

LanguageProfile python() {
    LanguageProfile profile;
    profile.name = "python";
    profile.image = "gradebox/python:3.11";
    profile.dockerfile =
        "FROM python:3.11-slim\n"
        "RUN pip install --no-cache-dir pytest==8.2.2\n"
        "ENV PYTHONDONTWRITEBYTECODE=1\n"
        "WORKDIR /workspace\n";
    profile.command =
        "python -m pytest -q -p no:cacheprovider "
        "--junitxml=.gradebox/report.xml tests";
    profile.report_pattern = ".gradebox/report.xml";
    profile.report_format = ReportFormat::JUNIT_XML;
    profile.extensions = {".py"};
    profile.denied_patterns = {
        R"(\bos\.(system|popen|exec[lv]p?e?|spawn[lv]p?e?|fork)\s*\()",
        R"(\bsubprocess\b)",
        R"(\b__import__\s*\()",
        R"((^|[^.\w])(eval|exec)\s*\()",
        R"(\bimport\s+(pty|ctypes)\b)",
        R"(\bfrom\s+(pty|ctypes)\s+import\b)",
    };
    profile.reserved_files = {"conftest.py", "pytest.ini", "pyproject.toml", "setup.cfg", "tox.ini"};
    return profile;
}

LanguageProfile java() {
    LanguageProfile profile;
    profile.name = "java";
    profile.image = "gradebox/java:17";
    profile.dockerfile =
        "FROM eclipse-temurin:17-jdk\n"
        "RUN mkdir -p /opt/junit && curl -fsSL -o /opt/junit/junit-console.jar "
        "https://repo1.maven.org/maven2/org/junit/platform/junit-platform-console-standalone/"
        "1.10.2/junit-platform-console-standalone-1.10.2.jar\n"
        "WORKDIR /workspace\n";
    profile.command =
        "mkdir -p /tmp/classes && "
        "javac -d /tmp/classes -cp /opt/junit/junit-console.jar $(find . -name '*.java') && "
        "java -jar /opt/junit/junit-console.jar execute --class-path /tmp/classes "
        "--scan-class-path --disable-banner --reports-dir=.gradebox/reports";
    profile.report_pattern = ".gradebox/reports/*.xml";
    profile.report_format = ReportFormat::JUNIT_XML;
    profile.extensions = {".java"};
    profile.denied_patterns = {
        R"(\bRuntime\s*\.\s*getRuntime\s*\(\s*\)\s*\.\s*exec\b)",
        R"(\bProcessBuilder\b)",
        R"(\bjava\.lang\.reflect\b)",
        R"(\bSystem\s*\.\s*exit\s*\()",
    };
    return profile;
}

LanguageProfile javascript() {
    LanguageProfile profile;
    profile.name = "javascript";
    profile.image = "gradebox/node:20";
    profile.dockerfile =
        "FROM node:20-slim\n"
        "WORKDIR /workspace\n";
    profile.command = "node --test --test-reporter=tap tests/";
    profile.report_format = ReportFormat::STDOUT;
    profile.extensions = {".js", ".mjs", ".cjs"};
    profile.denied_patterns = {
        R"(\bchild_process\b)",
        R"((^|[^.\w])eval\s*\()",
        R"(\bnew\s+Function\s*\()",
        R"(\bprocess\s*\.\s*binding\s*\()",
    };
    profile.reserved_files = {"package.json"};
    return profile;
}

LanguageProfile cpp() {
    LanguageProfile profile;
    profile.name = "cpp";
    profile.image = "gradebox/gcc:13";
    profile.dockerfile =
        "FROM gcc:13\n"
        "WORKDIR /workspace\n";
    profile.command =
        "g++ -std=c++17 -O2 -o /tmp/run_tests $(find . -name '*.cpp') && /tmp/run_tests";
    profile.report_format = ReportFormat::STDOUT;
    profile.extensions = {".cpp", ".cc", ".h", ".hpp"};
    profile.denied_patterns = {
        R"((^|[^.\w])system\s*\()",
        R"(\bpopen\s*\()",
        R"(\bfork\s*\()",
        R"(\bexec[lv]p?e?\s*\()",
        R"(\basm\s*\()",
        R"(#\s*include\s*<sys/(ptrace|socket)\.h>)",
    };
    return profile;
}

} // namespace BuiltInLanguages

} // namespace gradebox
