/**
 * @file GigaChatGateway.hpp
 * @brief HTTPS adapter for the GigaChat OAuth and chat completion endpoints.
 */

#pragma once

#include "domain/CompletionGateway.hpp"

#include <chrono>
#include <string>

namespace invoiceauditor::infrastructure {

class GigaChatGateway : public domain::CompletionGateway {
public:
    struct Endpoints {
        std::string authUrl;
        std::string apiUrl;
        int authTimeoutSeconds = 30;
        int completionTimeoutSeconds = 60;
        bool verifyTls = false;
    };

    /** @throws std::invalid_argument if a URL cannot be split into origin and path. */
    explicit GigaChatGateway(Endpoints endpoints);

    domain::GatewayReply exchangeCredential(const std::string& authKey,
                                            const std::string& scope,
                                            const std::string& requestId) override;

    domain::GatewayReply postCompletion(const std::string& bearerToken,
                                        const std::string& requestJson) override;

    /**
     * @brief Splits "https://host:port/path" into origin and path.
     * @return false if @p url has no scheme or host.
     */
    static bool SplitUrl(const std::string& url, std::string& origin, std::string& path);

    /**
     * @brief Whether a failed call counts as a timeout.
     *
     * httplib reports a read timeout and a peer reset with the same error, so a
     * read failure is a timeout only when the call lasted the whole read bound.
     */
    static bool IsTimeout(bool connectionTimedOut,
                          bool readFailed,
                          std::chrono::milliseconds elapsed,
                          int readTimeoutSeconds);

private:
    Endpoints m_endpoints;
    std::string m_authOrigin;
    std::string m_authPath;
    std::string m_apiOrigin;
    std::string m_apiPath;
};

} // namespace invoiceauditor::infrastructure
