#pragma once

#include "collaborators.h"

#include <map>
#include <mutex>

namespace gradebox {

// Thread-safe in-process submission store. Rejects transitions that would
// move a submission backwards.
class InMemorySubmissionStore : public SubmissionStore {
public:
    void insert(const Submission& submission) override;

    void update_status(
        const std::string& submission_id,
        SubmissionStatus status,
        std::optional<int> score = std::nullopt,
        std::optional<SubmissionFeedback> feedback = std::nullopt
    ) override;

    std::optional<Submission> find(const std::string& submission_id) override;
    std::vector<std::string> list_unfinished() override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Submission> submissions_;
};

// Problems registered in code, for tests and embedding
class InMemoryProblemCatalog : public ProblemLookup {
public:
    void add(const Problem& problem);
    std::optional<Problem> find_by_id(const std::string& problem_id) override;

private:
    std::mutex mutex_;
    std::map<std::string, Problem> problems_;
};

} // namespace gradebox
