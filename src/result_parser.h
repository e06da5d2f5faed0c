#pragma once

#include "submission.h"
#include "sandbox.h"
#include "language_registry.h"

#include <string>

namespace gradebox {

// Result of interpreting one execution's output
struct ParseOutcome {
    bool ok = false;
    TestOutcome outcome;
    std::string source;                   // Report path, or "stdout"
    std::string error;                    // Set when ok is false
};

// Turns raw test-runner output into pass/fail counts.
// Structured reports are preferred; stdout is scanned only when the run
// left no report file.
class ResultParser {
public:
    // Never throws; malformed output comes back as ok == false
    static ParseOutcome parse(const ExecutionResult& result, ReportFormat format);

    // The format parsers throw ParseError on malformed input

    // <testsuite>/<testcase> with <failure>, <error> and <skipped> children.
    // Skipped cases are not counted.
    static TestOutcome parse_junit_xml(const std::string& xml);

    // {"tests": [{"name", "outcome", "message"}]} or pytest-json-report
    static TestOutcome parse_json_report(const std::string& json);

    // PASS/FAIL lines, TAP, or a pytest summary line
    static TestOutcome parse_stdout(const std::string& output);

private:
    static void add_case(TestOutcome& outcome, const std::string& name,
                         bool passed, const std::string& message);
};

struct Score {
    int score = 0;                        // round(pass_rate * 100)
    double pass_rate = 0.0;               // 0.0 when no tests ran
};

// Pure: equal outcomes always score the same
Score score_outcome(const TestOutcome& outcome);

// "All tests passed", "N of M tests failed" or "No tests were run"
std::string outcome_message(const TestOutcome& outcome);

} // namespace gradebox
