#pragma once

#include "submission.h"

#include <string>
#include <map>
#include <mutex>
#include <functional>
#include <cstdint>

namespace gradebox {

// Fans evaluation-completed events out to subscribers (dashboards, the CLI)
class CompletionNotifier {
public:
    using Callback = std::function<void(const EvaluationCompleted&)>;
    using Token = uint64_t;

    // Receive every completion
    Token subscribe(Callback callback);

    // Receive only the completion of one submission
    Token subscribe(const std::string& submission_id, Callback callback);

    // Unknown tokens are ignored
    void unsubscribe(Token token);

    // Deliver to matching subscribers on the calling thread. A subscriber
    // that throws is logged and skipped.
    void publish(const EvaluationCompleted& event);

    size_t subscriber_count() const;

private:
    struct Subscription {
        std::string submission_id;   // Empty: all submissions
        Callback callback;
    };

    mutable std::mutex mutex_;
    std::map<Token, Subscription> subscriptions_;
    Token next_token_ = 1;
};

} // namespace gradebox
