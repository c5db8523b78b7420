/**
 * @file Credential.hpp
 * @brief Bearer credential for the completion service.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace invoiceauditor::domain {

/** @brief Source of "now". Injected so expiry can be tested with a fake clock. */
using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @struct Credential
 * @brief Opaque token and the instant it stops being accepted.
 */
struct Credential {
    std::string token;
    std::chrono::system_clock::time_point expiresAt;

    /** @brief True while now is earlier than expiry minus the safety buffer. */
    bool IsValidAt(std::chrono::system_clock::time_point now,
                   std::chrono::minutes buffer) const {
        return !token.empty() && now < expiresAt - buffer;
    }
};

} // namespace invoiceauditor::domain
