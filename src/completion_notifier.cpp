#include "completion_notifier.h"
#include <iostream>
#include <vector>

namespace gradebox {

CompletionNotifier::Token CompletionNotifier::subscribe(Callback callback) {
    return subscribe("", std::move(callback));
}

CompletionNotifier::Token CompletionNotifier::subscribe(const std::string& submission_id,
                                                        Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    Token token = next_token_++;
    subscriptions_[token] = Subscription{submission_id, std::move(callback)};
    return token;
}

void CompletionNotifier::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(token);
}

void CompletionNotifier::publish(const EvaluationCompleted& event) {
    // Copy matching callbacks so subscribers may (un)subscribe from inside one
    std::vector<Callback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, sub] : subscriptions_) {
            if (sub.submission_id.empty() || sub.submission_id == event.submission_id) {
                targets.push_back(sub.callback);
            }
        }
    }

    for (const auto& callback : targets) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Completion subscriber failed for "
                      << event.submission_id << ": " << e.what() << std::endl;
        }
    }
}

size_t CompletionNotifier::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace gradebox
