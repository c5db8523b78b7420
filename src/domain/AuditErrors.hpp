/**
 * @file AuditErrors.hpp
 * @brief Error taxonomy of the audit pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace invoiceauditor::domain {

/**
 * @class AuditError
 * @brief Base class for every failure the pipeline reports.
 */
class AuditError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Input document does not exist. Fatal. */
class NotFoundError : public AuditError {
public:
    using AuditError::AuditError;
};

/** @brief Neither embedded text nor recognition produced any text. Fatal. */
class ExtractionFailure : public AuditError {
public:
    using AuditError::AuditError;
};

/**
 * @class AuthError
 * @brief Credential exchange was rejected. Fatal, never retried.
 */
class AuthError : public AuditError {
public:
    AuthError(int status, std::string body)
        : AuditError("Authorization failed: " + std::to_string(status) + " - " + body),
          m_status(status),
          m_body(std::move(body)) {}

    int status() const { return m_status; }
    const std::string& body() const { return m_body; }

private:
    int m_status;
    std::string m_body;
};

/** @brief Failure to obtain an HTTP response. Recoverable until the last attempt. */
class TransportError : public AuditError {
public:
    using AuditError::AuditError;
};

/** @brief A call exceeded its time bound. Retried with linear backoff. */
class TimeoutError : public TransportError {
public:
    using TransportError::TransportError;
};

/** @brief All completion attempts were spent without an answer. */
class CompletionExhausted : public AuditError {
public:
    using AuditError::AuditError;
};

} // namespace invoiceauditor::domain
