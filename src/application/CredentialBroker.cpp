/**
 * @file CredentialBroker.cpp
 * @brief Implementation of CredentialBroker.
 */

#include "application/CredentialBroker.hpp"
#include "domain/AuditErrors.hpp"
#include "infrastructure/RequestId.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace invoiceauditor::application {

using json = nlohmann::json;

namespace {

std::string FormatClock(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

} // namespace

CredentialBroker::CredentialBroker(std::shared_ptr<domain::CompletionGateway> gateway,
                                   Settings settings,
                                   domain::Clock clock,
                                   std::function<std::string()> requestIdFactory)
    : m_gateway(std::move(gateway)),
      m_settings(std::move(settings)),
      m_clock(std::move(clock)),
      m_requestIdFactory(std::move(requestIdFactory)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::system_clock::now(); };
    }
    if (!m_requestIdFactory) {
        m_requestIdFactory = &infrastructure::RequestId::Generate;
    }
}

std::string CredentialBroker::token() {
    if (!m_credential || !m_credential->IsValidAt(m_clock(), m_settings.refreshBuffer)) {
        fetch();
    }
    return m_credential->token;
}

void CredentialBroker::invalidate() {
    m_credential.reset();
}

void CredentialBroker::fetch() {
    const auto now = m_clock();
    std::cout << "[CredentialBroker] Refreshing credential... (" << FormatClock(now) << ")" << std::endl;
    ++m_fetchCount;

    // TimeoutError and TransportError propagate; the caller's retry loop owns them.
    const domain::GatewayReply reply =
        m_gateway->exchangeCredential(m_settings.authKey, m_settings.scope, m_requestIdFactory());
    if (reply.httpStatus != 200) {
        throw domain::AuthError(reply.httpStatus, reply.body);
    }

    domain::Credential credential;
    try {
        auto body = json::parse(reply.body);
        if (!body.contains("access_token") || !body["access_token"].is_string()) {
            throw domain::AuthError(reply.httpStatus, "Reply missing access_token: " + reply.body);
        }
        credential.token = body["access_token"].get<std::string>();

        if (body.contains("expires_at") && body["expires_at"].is_number()) {
            const auto millis = body["expires_at"].get<long long>();
            credential.expiresAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
        } else {
            credential.expiresAt = now + m_settings.defaultLifetime;
        }
    } catch (const json::exception& e) {
        throw domain::AuthError(reply.httpStatus, std::string("Unreadable reply (") + e.what() + "): " + reply.body);
    }

    m_credential = std::move(credential);
    std::cout << "[CredentialBroker] Credential valid until " << FormatClock(m_credential->expiresAt) << std::endl;
}

} // namespace invoiceauditor::application
