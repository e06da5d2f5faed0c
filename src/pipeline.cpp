#include "pipeline.h"
#include "result_parser.h"
#include "file_utils.h"
#include "errors.h"

#include <iostream>
#include <thread>
#include <functional>

namespace gradebox {

namespace {

// Releases an in-flight claim on every exit path
class InFlightGuard {
public:
    explicit InFlightGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~InFlightGuard() { release_(); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::function<void()> release_;
};

std::string output_excerpt(const ExecutionResult& result, size_t max_bytes) {
    std::string text = result.stdout_output;
    if (!result.stderr_output.empty()) {
        if (!text.empty() && text.back() != '\n') text += '\n';
        text += result.stderr_output;
    }
    return FileUtils::truncate(text, max_bytes);
}

} // namespace

SubmissionPipeline::SubmissionPipeline(ProblemLookup& problems,
                                       SubmissionStore& store,
                                       const LanguageRegistry& languages,
                                       const SecurityValidator& validator,
                                       WorkspaceManager& workspaces,
                                       SandboxExecutor& executor,
                                       CompletionNotifier& notifier,
                                       const PipelineOptions& options)
    : problems_(problems),
      store_(store),
      languages_(languages),
      validator_(validator),
      workspaces_(workspaces),
      executor_(executor),
      notifier_(notifier),
      options_(options),
      pool_(std::make_unique<WorkerPool>(options.worker_count, options.queue_capacity)) {
    if (options_.persist_attempts < 1) {
        options_.persist_attempts = 1;
    }
}

SubmissionPipeline::~SubmissionPipeline() {
    shutdown();
}

size_t SubmissionPipeline::start() {
    size_t removed = workspaces_.cleanup_stale();
    if (removed > 0) {
        std::cout << "[Pipeline] Removed " << removed << " stale workspace(s)" << std::endl;
    }

    size_t rescheduled = 0;
    for (const auto& id : store_.list_unfinished()) {
        if (pool_->submit([this, id] { evaluate(id); })) {
            rescheduled++;
        } else {
            reject(id, "evaluation queue is full");
        }
    }
    if (rescheduled > 0) {
        std::cout << "[Pipeline] Rescheduled " << rescheduled << " unfinished submission(s)" << std::endl;
    }
    return rescheduled;
}

std::string SubmissionPipeline::create_submission(const std::string& user_id,
                                                  const std::string& problem_id,
                                                  const FileMap& files) {
    auto problem = problems_.find_by_id(problem_id);
    if (!problem) {
        throw NotFoundError("problem " + problem_id);
    }

    Submission submission;
    submission.id = "sub_" + FileUtils::random_hex(12);
    submission.user_id = user_id;
    submission.problem_id = problem_id;
    submission.language = problem->language;
    submission.files = files;
    submission.status = SubmissionStatus::PENDING;
    submission.created_at = std::chrono::system_clock::now();

    store_.insert(submission);
    std::cout << "[Pipeline] Created " << submission.id << " for problem " << problem_id
              << " (" << submission.language << ", " << files.size() << " files)" << std::endl;

    if (problem->test_files.empty()) {
        reject(submission.id, "Problem " + problem_id + " has no hidden tests; nothing was run");
        return submission.id;
    }

    std::string id = submission.id;
    if (!pool_->submit([this, id] { evaluate(id); })) {
        reject(id, "evaluation queue is full");
        throw QueueFullError(std::to_string(pool_->capacity()) + " evaluations already queued");
    }
    return id;
}

Submission SubmissionPipeline::get_submission(const std::string& submission_id) {
    auto submission = store_.find(submission_id);
    if (!submission) {
        throw NotFoundError("submission " + submission_id);
    }
    return *submission;
}

bool SubmissionPipeline::claim(const std::string& submission_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.insert(submission_id).second;
}

void SubmissionPipeline::release(const std::string& submission_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(submission_id);
}

size_t SubmissionPipeline::in_flight() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

void SubmissionPipeline::evaluate(const std::string& submission_id) {
    if (!claim(submission_id)) {
        std::cout << "[Pipeline] " << submission_id << " is already being evaluated" << std::endl;
        return;
    }
    InFlightGuard guard([this, submission_id] { release(submission_id); });

    SubmissionFeedback feedback;
    try {
        auto submission = store_.find(submission_id);
        if (!submission) {
            std::cerr << "[Pipeline] Unknown submission " << submission_id << std::endl;
            return;
        }
        if (is_terminal(submission->status)) {
            return;
        }
        if (submission->status == SubmissionStatus::PENDING) {
            store_.update_status(submission_id, SubmissionStatus::RUNNING);
        } else {
            std::cout << "[Pipeline] Resuming " << submission_id << " left running" << std::endl;
        }

        feedback = run_evaluation(*submission);
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Evaluation of " << submission_id << " failed: " << e.what() << std::endl;
        feedback = error_feedback("Evaluation failed due to an internal error");
    }

    complete(submission_id, feedback);
}

SubmissionFeedback SubmissionPipeline::run_evaluation(const Submission& submission) {
    std::string fingerprint = FileUtils::fingerprint(submission.language, submission.files);
    std::cout << "[Pipeline] Evaluating " << submission.id << " (fingerprint "
              << fingerprint.substr(0, 16) << ")" << std::endl;

    auto problem = problems_.find_by_id(submission.problem_id);
    if (!problem) {
        return error_feedback("Problem " + submission.problem_id + " no longer exists", fingerprint);
    }
    if (problem->test_files.empty()) {
        return error_feedback("Problem " + submission.problem_id + " has no hidden tests; nothing was run",
                              fingerprint);
    }
    auto language = languages_.find(submission.language);
    if (!language) {
        return error_feedback("Unsupported language: " + submission.language, fingerprint);
    }

    // The submission may not shadow anything the problem provides
    std::set<std::string> reserved = {"tests/", std::string(REPORT_DIR) + "/"};
    for (const auto& [path, content] : problem->test_files) reserved.insert(path);
    for (const auto& [path, content] : problem->scaffold_files) reserved.insert(path);

    ValidationResult validation = validator_.validate(submission.files, *language, reserved);
    if (!validation.ok) {
        std::cout << "[Pipeline] Rejected " << submission.id << ": " << validation.reason << std::endl;
        return error_feedback("Submission rejected: " + validation.reason, fingerprint);
    }

    FileMap staged = problem->scaffold_files;
    staged.insert(problem->test_files.begin(), problem->test_files.end());
    staged.insert(submission.files.begin(), submission.files.end());

    ExecutionLimits limits = options_.limits;
    if (problem->timeout) {
        limits.timeout = *problem->timeout;
    }
    if (problem->memory_limit_bytes) {
        limits.memory_bytes = *problem->memory_limit_bytes;
        limits.memory_swap_bytes = *problem->memory_limit_bytes;
    }

    // Fresh id per attempt so a retried submission never reuses a directory
    std::string execution_id = submission.id + "_" + FileUtils::random_hex(4);

    WorkspaceHandle workspace;
    try {
        workspace = workspaces_.stage(execution_id, staged);
    } catch (const WorkspaceError& e) {
        std::cerr << "[Pipeline] " << e.what() << std::endl;
        return error_feedback("Could not prepare the workspace", fingerprint);
    }

    ExecutionResult result = executor_.execute(execution_id, *language, workspace,
                                               language->command, limits);

    try {
        workspaces_.dispose(workspace);
    } catch (const WorkspaceError& e) {
        std::cerr << "[Pipeline] " << e.what() << std::endl;
    }

    return grade(result, *language, fingerprint);
}

SubmissionFeedback SubmissionPipeline::grade(const ExecutionResult& result,
                                             const LanguageProfile& language,
                                             const std::string& fingerprint) const {
    SubmissionFeedback feedback;
    feedback.fingerprint = fingerprint;
    feedback.exit_code = result.exit_code;
    feedback.duration_ms = result.duration.count();
    feedback.memory_bytes = result.memory_bytes;
    feedback.output_excerpt = output_excerpt(result, options_.output_excerpt_bytes);

    switch (result.status) {
        case ExecutionStatus::TIMED_OUT: {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(result.duration).count();
            feedback.status = SubmissionStatus::TIMED_OUT;
            feedback.message = "Time limit exceeded after " + std::to_string(seconds) + "s";
            break;
        }

        case ExecutionStatus::ERROR:
            std::cerr << "[Pipeline] Execution " << result.execution_id << " errored: "
                      << result.error << std::endl;
            feedback.status = SubmissionStatus::ERROR;
            feedback.message = "Execution failed due to an internal error";
            break;

        case ExecutionStatus::SUCCESS:
        case ExecutionStatus::FAILED: {
            ParseOutcome parsed = ResultParser::parse(result, language.report_format);
            bool clean_exit = result.status == ExecutionStatus::SUCCESS;

            if (!parsed.ok) {
                std::cerr << "[Pipeline] Could not read results of " << result.execution_id
                          << ": " << parsed.error << std::endl;
                if (clean_exit) {
                    feedback.status = SubmissionStatus::ERROR;
                    feedback.message = "Test results could not be read";
                } else {
                    feedback.status = SubmissionStatus::FAILED;
                    feedback.message = "Tests did not complete (exit code " +
                                       std::to_string(result.exit_code) + ")";
                }
                break;
            }

            Score score = score_outcome(parsed.outcome);
            feedback.outcome = parsed.outcome;
            feedback.pass_rate = score.pass_rate;
            feedback.score = score.score;
            feedback.status = clean_exit ? SubmissionStatus::SUCCESS : SubmissionStatus::FAILED;
            feedback.message = outcome_message(parsed.outcome);
            if (!clean_exit) {
                feedback.message += " (exit code " + std::to_string(result.exit_code) + ")";
            }
            break;
        }
    }

    return feedback;
}

SubmissionFeedback SubmissionPipeline::error_feedback(const std::string& message,
                                                      const std::string& fingerprint) const {
    SubmissionFeedback feedback;
    feedback.status = SubmissionStatus::ERROR;
    feedback.message = message;
    feedback.fingerprint = fingerprint;
    feedback.exit_code = -1;
    return feedback;
}

void SubmissionPipeline::complete(const std::string& submission_id, const SubmissionFeedback& feedback) {
    bool persisted = false;
    for (int attempt = 1; attempt <= options_.persist_attempts && !persisted; attempt++) {
        try {
            store_.update_status(submission_id, feedback.status, feedback.score, feedback);
            persisted = true;
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Persisting " << submission_id << " failed (attempt "
                      << attempt << "/" << options_.persist_attempts << "): " << e.what() << std::endl;
            if (attempt < options_.persist_attempts) {
                std::this_thread::sleep_for(options_.persist_retry_delay);
            }
        }
    }

    if (!persisted) {
        // A record that is already terminal was completed and announced earlier
        std::optional<Submission> stored;
        try {
            stored = store_.find(submission_id);
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Re-reading " << submission_id << " failed: " << e.what() << std::endl;
        }
        if (stored && is_terminal(stored->status)) {
            std::cerr << "[Pipeline] " << submission_id << " is already "
                      << status_to_string(stored->status) << "; dropping "
                      << status_to_string(feedback.status) << std::endl;
            return;
        }
        std::cerr << "[Pipeline] FATAL: final status " << status_to_string(feedback.status)
                  << " of " << submission_id << " was not recorded" << std::endl;
    } else {
        std::cout << "[Pipeline] " << submission_id << " -> " << status_to_string(feedback.status)
                  << " (score " << feedback.score << ")" << std::endl;
    }

    EvaluationCompleted event;
    event.submission_id = submission_id;
    event.status = feedback.status;
    event.score = feedback.score;
    notifier_.publish(event);
}

void SubmissionPipeline::reject(const std::string& submission_id, const std::string& message) {
    std::cout << "[Pipeline] Not evaluating " << submission_id << ": " << message << std::endl;
    complete(submission_id, error_feedback(message));
}

void SubmissionPipeline::shutdown() {
    pool_->shutdown();
}

} // namespace gradebox
