#pragma once

#include <string>
#include <map>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace gradebox {

// Relative path -> file content (text or binary bytes)
using FileMap = std::map<std::string, std::string>;

// Submission lifecycle. Success, Failed, TimedOut and Error are terminal.
enum class SubmissionStatus {
    PENDING,
    RUNNING,
    SUCCESS,
    FAILED,
    TIMED_OUT,
    ERROR
};

bool is_terminal(SubmissionStatus status);

// Forward-only transition check used by the pipeline and the stores
bool can_transition(SubmissionStatus from, SubmissionStatus to);

std::string status_to_string(SubmissionStatus status);
std::optional<SubmissionStatus> status_from_string(const std::string& name);

// One hidden test's result
struct TestCaseResult {
    std::string name;
    bool passed = false;
    std::string message;                  // Failure message, empty when passed
};

// Parsed test counts. Derived from execution output, never stored on its own.
struct TestOutcome {
    int total = 0;
    int passed = 0;
    int failed = 0;
    std::vector<TestCaseResult> cases;    // In report order
};

// Graded report attached to a finished submission. Immutable once built.
struct SubmissionFeedback {
    TestOutcome outcome;
    double pass_rate = 0.0;
    int score = 0;                        // 0-100
    SubmissionStatus status = SubmissionStatus::ERROR;
    std::string message;                  // Human-readable summary
    std::string output_excerpt;           // Truncated stdout/stderr
    int exit_code = 0;
    int64_t duration_ms = 0;
    size_t memory_bytes = 0;
    std::string fingerprint;              // SHA-256 of language + files
};

struct Submission {
    std::string id;
    std::string user_id;
    std::string problem_id;
    std::string language;
    FileMap files;
    SubmissionStatus status = SubmissionStatus::PENDING;
    std::optional<int> score;             // Only set together with feedback
    std::optional<SubmissionFeedback> feedback;
    std::chrono::system_clock::time_point created_at;
};

// Read-only problem definition owned by the catalog
struct Problem {
    std::string id;
    std::string language;
    FileMap scaffold_files;               // Build files copied next to the solution
    FileMap test_files;                   // Hidden tests, must be non-empty to evaluate
    std::optional<std::chrono::seconds> timeout;
    std::optional<size_t> memory_limit_bytes;
};

// Published once per submission when it reaches a terminal status
struct EvaluationCompleted {
    std::string submission_id;
    SubmissionStatus status = SubmissionStatus::ERROR;
    std::optional<int> score;
};

} // namespace gradebox
