/**
 * @file CompletionGateway.hpp
 * @brief Interface to the external completion service endpoints.
 */

#pragma once

#include <string>

namespace invoiceauditor::domain {

/**
 * @struct GatewayReply
 * @brief HTTP response as received, status code not interpreted.
 */
struct GatewayReply {
    int httpStatus = 0;
    std::string body;
};

/**
 * @class CompletionGateway
 * @brief Abstract access to the credential exchange and completion endpoints.
 *
 * Implementations throw domain::TimeoutError when a call exceeds its time
 * bound and domain::TransportError for any other failure to obtain a response.
 */
class CompletionGateway {
public:
    virtual ~CompletionGateway() = default;

    /**
     * @brief Exchanges the pre-shared secret for a bearer token.
     * @param authKey Basic-auth secret.
     * @param scope Scope form parameter.
     * @param requestId Fresh per-call identifier.
     */
    virtual GatewayReply exchangeCredential(const std::string& authKey,
                                            const std::string& scope,
                                            const std::string& requestId) = 0;

    /**
     * @brief Posts a chat completion request.
     * @param bearerToken Current credential.
     * @param requestJson Serialized request body.
     */
    virtual GatewayReply postCompletion(const std::string& bearerToken,
                                        const std::string& requestJson) = 0;
};

} // namespace invoiceauditor::domain
