/**
 * @file CredentialBroker.hpp
 * @brief Owns the bearer credential and refreshes it transparently.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "domain/CompletionGateway.hpp"
#include "domain/Credential.hpp"

namespace invoiceauditor::application {

/**
 * @class CredentialBroker
 * @brief State machine Unset -> Valid -> (near expiry) -> Valid, with explicit invalidate.
 *
 * Single-threaded by contract: the pipeline processes one document at a time,
 * so concurrent fetches are not de-duplicated.
 */
class CredentialBroker {
public:
    struct Settings {
        std::string authKey;
        std::string scope = "GIGACHAT_API_PERS";
        std::chrono::minutes refreshBuffer{5};
        std::chrono::minutes defaultLifetime{30};   ///< Used when the reply has no expires_at.
    };

    CredentialBroker(std::shared_ptr<domain::CompletionGateway> gateway,
                     Settings settings,
                     domain::Clock clock = nullptr,
                     std::function<std::string()> requestIdFactory = nullptr);

    /**
     * @brief Returns a token valid for at least the refresh buffer, fetching if needed.
     * @throws domain::AuthError when the exchange is rejected.
     * @throws domain::TimeoutError, domain::TransportError when the exchange call fails.
     */
    std::string token();

    /** @brief Forces the next token() call to fetch. */
    void invalidate();

    /** @brief Current credential, if any. */
    const std::optional<domain::Credential>& current() const { return m_credential; }

    /** @brief Number of exchange calls made so far. */
    int fetchCount() const { return m_fetchCount; }

private:
    std::shared_ptr<domain::CompletionGateway> m_gateway;
    Settings m_settings;
    domain::Clock m_clock;
    std::function<std::string()> m_requestIdFactory;
    std::optional<domain::Credential> m_credential;
    int m_fetchCount = 0;

    void fetch();
};

} // namespace invoiceauditor::application
