/**
 * @file InvoiceAuditService.hpp
 * @brief Orchestrates acquisition, normalization, extraction and validation.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "application/CompletionClient.hpp"
#include "application/ConsistencyValidator.hpp"
#include "application/DocumentTextAcquirer.hpp"
#include "domain/DocumentPage.hpp"
#include "domain/InvoiceRecord.hpp"

namespace invoiceauditor::application {

/**
 * @struct AuditOutcome
 * @brief Terminal value of one audit run.
 */
struct AuditOutcome {
    domain::CompletionResult result;
    std::optional<ConsistencyValidator::Report> report;    ///< Present only for a record.
    domain::ExtractedText source;                          ///< Normalized text and per-page provenance.

    bool HasRecord() const { return std::holds_alternative<domain::InvoiceRecord>(result); }

    /** @brief The record (all ten keys) or the diagnostic failure record. */
    nlohmann::json ToJson() const;
};

/**
 * @class InvoiceAuditService
 * @brief Runs one document through the pipeline, synchronously.
 */
class InvoiceAuditService {
public:
    InvoiceAuditService(std::shared_ptr<DocumentTextAcquirer> acquirer,
                        std::shared_ptr<CompletionClient> client,
                        ConsistencyValidator validator);

    /**
     * @throws domain::NotFoundError, domain::ExtractionFailure, domain::AuthError,
     *         domain::TransportError, domain::CompletionExhausted
     */
    AuditOutcome audit(const std::string& path);

private:
    std::shared_ptr<DocumentTextAcquirer> m_acquirer;
    std::shared_ptr<CompletionClient> m_client;
    ConsistencyValidator m_validator;
};

} // namespace invoiceauditor::application
