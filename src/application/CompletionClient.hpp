/**
 * @file CompletionClient.hpp
 * @brief Submits the extraction prompt and drives the bounded retry loop.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "application/CredentialBroker.hpp"
#include "application/ResponseRecoveryParser.hpp"
#include "domain/CompletionAttempt.hpp"
#include "domain/CompletionGateway.hpp"
#include "domain/InvoiceRecord.hpp"

namespace invoiceauditor::application {

/**
 * @struct RetryPolicy
 * @brief Bounds of the completion retry loop.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds timeoutBackoffStep{1000};    ///< Linear: step * n-th timeout.
    std::chrono::milliseconds failureDelay{1000};
};

/**
 * @brief Maps an attempt outcome to the next step of the loop.
 * @param outcome Classified result of the attempt.
 * @param attempt 1-based attempt ordinal.
 * @param timeoutsSoFar Timeouts seen so far, this attempt included.
 *
 * Authorization expiry retries at once and never advances the timeout
 * backoff; the final attempt never retries.
 */
domain::RetryDecision DecideRetry(domain::AttemptOutcome outcome,
                                  int attempt,
                                  int timeoutsSoFar,
                                  const RetryPolicy& policy = RetryPolicy{});

/**
 * @class CompletionClient
 * @brief Builds the fixed prompt, calls the service and recovers a record.
 */
class CompletionClient {
public:
    static constexpr std::size_t kPromptTextLimit = 4000;     ///< Code points of source text in the prompt.
    static constexpr std::size_t kDiagnosticTextLimit = 1000;
    static constexpr double kTemperature = 0.1;
    static constexpr int kMaxTokens = 1024;

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    CompletionClient(std::shared_ptr<domain::CompletionGateway> gateway,
                     std::shared_ptr<CredentialBroker> broker,
                     std::string model = "GigaChat",
                     RetryPolicy policy = RetryPolicy{},
                     Sleeper sleeper = nullptr);

    /**
     * @brief Extracts an invoice record from normalized document text.
     * @return The record, or a DiagnosticFailure when the final answer was empty.
     * @throws domain::CompletionExhausted when attempts run out on timeouts or expiry.
     * @throws domain::TransportError when the final attempt fails in transport.
     * @throws domain::AuthError when the credential exchange is rejected.
     */
    domain::CompletionResult extract(const std::string& normalizedText);

    /** @brief Fills the prompt template with the first 4000 code points of @p text. */
    static std::string BuildPrompt(const std::string& text);

    /** @brief Serialized request body for @p prompt. */
    std::string buildRequest(const std::string& prompt) const;

    /** @brief Reads choices[0].message.content. @throws domain::TransportError */
    static std::string ReadReplyContent(const std::string& body);

    /** @brief Attempts made by the last extract() call. */
    const std::vector<domain::CompletionAttempt>& attempts() const { return m_attempts; }

private:
    std::shared_ptr<domain::CompletionGateway> m_gateway;
    std::shared_ptr<CredentialBroker> m_broker;
    std::string m_model;
    RetryPolicy m_policy;
    Sleeper m_sleeper;
    ResponseRecoveryParser m_parser;
    std::vector<domain::CompletionAttempt> m_attempts;
};

} // namespace invoiceauditor::application
