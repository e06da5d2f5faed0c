#pragma once

#include "submission.h"

#include <string>
#include <vector>
#include <optional>

namespace gradebox {

// Problem catalog owned outside the evaluation core
class ProblemLookup {
public:
    virtual ~ProblemLookup() = default;

    // Returns std::nullopt when no problem has this id
    virtual std::optional<Problem> find_by_id(const std::string& problem_id) = 0;
};

// Durable submission storage owned outside the evaluation core.
// Implementations throw PersistenceError when a write cannot be made durable.
class SubmissionStore {
public:
    virtual ~SubmissionStore() = default;

    virtual void insert(const Submission& submission) = 0;

    // One logical update per transition. score and feedback are only passed
    // for terminal statuses.
    virtual void update_status(
        const std::string& submission_id,
        SubmissionStatus status,
        std::optional<int> score = std::nullopt,
        std::optional<SubmissionFeedback> feedback = std::nullopt
    ) = 0;

    virtual std::optional<Submission> find(const std::string& submission_id) = 0;

    // Submissions still Pending or Running, used to resume after a restart
    virtual std::vector<std::string> list_unfinished() = 0;
};

} // namespace gradebox
