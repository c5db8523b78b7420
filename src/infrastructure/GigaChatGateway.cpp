#include "infrastructure/GigaChatGateway.hpp"
#include "domain/AuditErrors.hpp"

#include <httplib.h>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace invoiceauditor::infrastructure {

namespace {

domain::GatewayReply Send(httplib::Client& cli,
                          const std::string& origin,
                          const std::string& path,
                          const httplib::Headers& headers,
                          const std::string& body,
                          const std::string& contentType,
                          int timeoutSeconds) {
    const auto started = std::chrono::steady_clock::now();
    auto res = cli.Post(path, headers, body, contentType);
    if (!res) {
        const auto err = res.error();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        const std::string message = origin + path + ": " + httplib::to_string(err);
        if (GigaChatGateway::IsTimeout(err == httplib::Error::ConnectionTimeout, err == httplib::Error::Read,
                                       elapsed, timeoutSeconds)) {
            throw domain::TimeoutError("Request timed out: " + message);
        }
        throw domain::TransportError("Connection failed: " + message);
    }
    return {res->status, res->body};
}

} // namespace

GigaChatGateway::GigaChatGateway(Endpoints endpoints)
    : m_endpoints(std::move(endpoints)) {
    if (!SplitUrl(m_endpoints.authUrl, m_authOrigin, m_authPath)) {
        throw std::invalid_argument("Invalid auth URL: " + m_endpoints.authUrl);
    }
    if (!SplitUrl(m_endpoints.apiUrl, m_apiOrigin, m_apiPath)) {
        throw std::invalid_argument("Invalid API URL: " + m_endpoints.apiUrl);
    }
    if (!m_endpoints.verifyTls) {
        std::cerr << "[GigaChatGateway] TLS certificate verification disabled." << std::endl;
    }
}

bool GigaChatGateway::SplitUrl(const std::string& url, std::string& origin, std::string& path) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) return false;
    const auto hostStart = schemeEnd + 3;
    const auto pathStart = url.find('/', hostStart);
    if (pathStart == hostStart) return false;
    if (pathStart == std::string::npos) {
        if (hostStart >= url.size()) return false;
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, pathStart);
        path = url.substr(pathStart);
    }
    return true;
}

bool GigaChatGateway::IsTimeout(bool connectionTimedOut,
                                bool readFailed,
                                std::chrono::milliseconds elapsed,
                                int readTimeoutSeconds) {
    if (connectionTimedOut) return true;
    return readFailed && elapsed >= std::chrono::seconds(readTimeoutSeconds);
}

domain::GatewayReply GigaChatGateway::exchangeCredential(const std::string& authKey,
                                                         const std::string& scope,
                                                         const std::string& requestId) {
    httplib::Client cli(m_authOrigin);
    cli.set_connection_timeout(m_endpoints.authTimeoutSeconds);
    cli.set_read_timeout(m_endpoints.authTimeoutSeconds);
    cli.enable_server_certificate_verification(m_endpoints.verifyTls);

    httplib::Headers headers = {
        {"Accept", "application/json"},
        {"RqUID", requestId},
        {"Authorization", "Basic " + authKey}
    };
    return Send(cli, m_authOrigin, m_authPath, headers, "scope=" + scope,
                "application/x-www-form-urlencoded", m_endpoints.authTimeoutSeconds);
}

domain::GatewayReply GigaChatGateway::postCompletion(const std::string& bearerToken,
                                                     const std::string& requestJson) {
    httplib::Client cli(m_apiOrigin);
    cli.set_connection_timeout(m_endpoints.completionTimeoutSeconds);
    cli.set_read_timeout(m_endpoints.completionTimeoutSeconds);
    cli.enable_server_certificate_verification(m_endpoints.verifyTls);

    httplib::Headers headers = {
        {"Accept", "application/json"},
        {"Authorization", "Bearer " + bearerToken}
    };
    return Send(cli, m_apiOrigin, m_apiPath, headers, requestJson, "application/json",
                m_endpoints.completionTimeoutSeconds);
}

} // namespace invoiceauditor::infrastructure
