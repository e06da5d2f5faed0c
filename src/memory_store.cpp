#include "memory_store.h"
#include "errors.h"

namespace gradebox {

void InMemorySubmissionStore::insert(const Submission& submission) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!submissions_.emplace(submission.id, submission).second) {
        throw PersistenceError("duplicate submission id " + submission.id);
    }
}

void InMemorySubmissionStore::update_status(const std::string& submission_id,
                                            SubmissionStatus status,
                                            std::optional<int> score,
                                            std::optional<SubmissionFeedback> feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = submissions_.find(submission_id);
    if (it == submissions_.end()) {
        throw PersistenceError("unknown submission " + submission_id);
    }

    Submission& stored = it->second;
    if (!can_transition(stored.status, status)) {
        throw PersistenceError("illegal transition " + status_to_string(stored.status) +
                               " -> " + status_to_string(status) + " for " + submission_id);
    }

    stored.status = status;
    if (feedback) {
        stored.feedback = std::move(feedback);
        stored.score = score;
    }
}

std::optional<Submission> InMemorySubmissionStore::find(const std::string& submission_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = submissions_.find(submission_id);
    if (it == submissions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> InMemorySubmissionStore::list_unfinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, submission] : submissions_) {
        if (!is_terminal(submission.status)) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t InMemorySubmissionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submissions_.size();
}

void InMemoryProblemCatalog::add(const Problem& problem) {
    std::lock_guard<std::mutex> lock(mutex_);
    problems_[problem.id] = problem;
}

std::optional<Problem> InMemoryProblemCatalog::find_by_id(const std::string& problem_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = problems_.find(problem_id);
    if (it == problems_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace gradebox
