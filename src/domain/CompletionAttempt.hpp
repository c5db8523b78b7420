/**
 * @file CompletionAttempt.hpp
 * @brief Value objects for the bounded completion retry loop.
 */

#pragma once

#include <chrono>
#include <string>

namespace invoiceauditor::domain {

/**
 * @enum AttemptOutcome
 * @brief Classified result of one completion attempt.
 */
enum class AttemptOutcome {
    Success,
    AuthExpired,    ///< Service answered 401.
    Timeout,
    OtherFailure
};

inline std::string OutcomeToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Success: return "Success";
        case AttemptOutcome::AuthExpired: return "AuthExpired";
        case AttemptOutcome::Timeout: return "Timeout";
        case AttemptOutcome::OtherFailure: return "OtherFailure";
        default: return "Unknown";
    }
}

/**
 * @struct CompletionAttempt
 * @brief One pass through the retry loop. Ordinal is 1-based.
 */
struct CompletionAttempt {
    int ordinal = 1;
    AttemptOutcome outcome = AttemptOutcome::OtherFailure;
};

/**
 * @struct RetryDecision
 * @brief What the retry loop does after an attempt.
 */
struct RetryDecision {
    enum class Action {
        Accept,             ///< Attempt succeeded; stop.
        RetryImmediately,
        RetryAfterDelay,
        Fail
    };

    Action action = Action::Fail;
    std::chrono::milliseconds delay{0};

    bool operator==(const RetryDecision& other) const {
        return action == other.action && delay == other.delay;
    }
};

} // namespace invoiceauditor::domain
