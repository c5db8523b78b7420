#include "application/InvoiceAuditService.hpp"
#include "application/TextNormalizer.hpp"

#include <iostream>

namespace invoiceauditor::application {

nlohmann::json AuditOutcome::ToJson() const {
    if (const auto* record = std::get_if<domain::InvoiceRecord>(&result)) {
        return record->ToJson();
    }
    return std::get<domain::DiagnosticFailure>(result).ToJson();
}

InvoiceAuditService::InvoiceAuditService(std::shared_ptr<DocumentTextAcquirer> acquirer,
                                         std::shared_ptr<CompletionClient> client,
                                         ConsistencyValidator validator)
    : m_acquirer(std::move(acquirer)),
      m_client(std::move(client)),
      m_validator(validator) {}

AuditOutcome InvoiceAuditService::audit(const std::string& path) {
    AuditOutcome outcome;
    outcome.source = m_acquirer->acquire(path);
    outcome.source.content = TextNormalizer::Normalize(outcome.source.content);
    std::cout << "[InvoiceAuditService] Normalized text: " << outcome.source.content.size() << " bytes" << std::endl;

    std::cout << "[InvoiceAuditService] Requesting extraction..." << std::endl;
    outcome.result = m_client->extract(outcome.source.content);

    if (const auto* record = std::get_if<domain::InvoiceRecord>(&outcome.result)) {
        std::cout << "[InvoiceAuditService] Validating record..." << std::endl;
        outcome.report = m_validator.Validate(*record);
    } else {
        std::cerr << "[InvoiceAuditService] No record recovered, returning diagnostic failure" << std::endl;
    }
    return outcome;
}

} // namespace invoiceauditor::application
