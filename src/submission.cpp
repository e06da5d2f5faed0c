#include "submission.h"

namespace gradebox {

bool is_terminal(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::SUCCESS:
        case SubmissionStatus::FAILED:
        case SubmissionStatus::TIMED_OUT:
        case SubmissionStatus::ERROR:
            return true;
        case SubmissionStatus::PENDING:
        case SubmissionStatus::RUNNING:
            return false;
    }
    return false;
}

bool can_transition(SubmissionStatus from, SubmissionStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    if (from == SubmissionStatus::PENDING) {
        return to != SubmissionStatus::PENDING;
    }
    // RUNNING
    return is_terminal(to);
}

std::string status_to_string(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::PENDING: return "pending";
        case SubmissionStatus::RUNNING: return "running";
        case SubmissionStatus::SUCCESS: return "success";
        case SubmissionStatus::FAILED: return "failed";
        case SubmissionStatus::TIMED_OUT: return "timed_out";
        case SubmissionStatus::ERROR: return "error";
    }
    return "error";
}

std::optional<SubmissionStatus> status_from_string(const std::string& name) {
    static const std::map<std::string, SubmissionStatus> by_name = {
        {"pending", SubmissionStatus::PENDING},
        {"running", SubmissionStatus::RUNNING},
        {"success", SubmissionStatus::SUCCESS},
        {"failed", SubmissionStatus::FAILED},
        {"timed_out", SubmissionStatus::TIMED_OUT},
        {"error", SubmissionStatus::ERROR},
    };

    auto it = by_name.find(name);
    if (it == by_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace gradebox
