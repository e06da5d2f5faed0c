#pragma once

#include "collaborators.h"
#include "language_registry.h"
#include "security_validator.h"
#include "workspace.h"
#include "sandbox.h"
#include "completion_notifier.h"
#include "worker_pool.h"
#include "constants.h"

#include <string>
#include <set>
#include <mutex>
#include <memory>
#include <chrono>

namespace gradebox {

struct PipelineOptions {
    ExecutionLimits limits;                       // Problem settings override timeout and memory
    size_t worker_count = DEFAULT_WORKER_COUNT;
    size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;
    int persist_attempts = DEFAULT_PERSIST_ATTEMPTS;
    std::chrono::milliseconds persist_retry_delay{PERSIST_RETRY_DELAY_MILLISECONDS};
    size_t output_excerpt_bytes = MAX_OUTPUT_EXCERPT;
};

// Drives submissions from Pending to a terminal status on a bounded pool of
// workers. At most one evaluation per submission id runs at a time, and no
// fault inside an evaluation leaves a submission Pending or Running.
class SubmissionPipeline {
public:
    SubmissionPipeline(ProblemLookup& problems,
                       SubmissionStore& store,
                       const LanguageRegistry& languages,
                       const SecurityValidator& validator,
                       WorkspaceManager& workspaces,
                       SandboxExecutor& executor,
                       CompletionNotifier& notifier,
                       const PipelineOptions& options = PipelineOptions());
    ~SubmissionPipeline();

    SubmissionPipeline(const SubmissionPipeline&) = delete;
    SubmissionPipeline& operator=(const SubmissionPipeline&) = delete;

    // Remove stale workspaces and reschedule unfinished submissions left by
    // a previous process. Returns the number rescheduled.
    size_t start();

    // Persist a Pending submission and queue its evaluation. Never blocks on
    // execution.
    // Throws NotFoundError for an unknown problem and QueueFullError when the
    // queue is saturated (the submission is then resolved to Error).
    std::string create_submission(const std::string& user_id,
                                  const std::string& problem_id,
                                  const FileMap& files);

    // Throws NotFoundError for an unknown id
    Submission get_submission(const std::string& submission_id);

    // One evaluation attempt. No-op for terminal submissions and for ids
    // already being evaluated. Never throws.
    void evaluate(const std::string& submission_id);

    // Finish queued work and stop the workers. Idempotent.
    void shutdown();

    size_t in_flight() const;

private:
    bool claim(const std::string& submission_id);
    void release(const std::string& submission_id);

    SubmissionFeedback run_evaluation(const Submission& submission);
    SubmissionFeedback grade(const ExecutionResult& result,
                             const LanguageProfile& language,
                             const std::string& fingerprint) const;
    SubmissionFeedback error_feedback(const std::string& message,
                                      const std::string& fingerprint = "") const;

    // Persist the terminal state with retry, then notify subscribers
    void complete(const std::string& submission_id, const SubmissionFeedback& feedback);

    // Resolve a submission that never reached a worker
    void reject(const std::string& submission_id, const std::string& message);

    ProblemLookup& problems_;
    SubmissionStore& store_;
    const LanguageRegistry& languages_;
    const SecurityValidator& validator_;
    WorkspaceManager& workspaces_;
    SandboxExecutor& executor_;
    CompletionNotifier& notifier_;
    PipelineOptions options_;

    mutable std::mutex in_flight_mutex_;
    std::set<std::string> in_flight_;

    std::unique_ptr<WorkerPool> pool_;            // Last member: stopped before the rest
};

} // namespace gradebox
