#include <cassert>
#include <iostream>

#include "application/ConsistencyValidator.hpp"

using namespace invoiceauditor;
using application::ConsistencyValidator;

namespace {

domain::InvoiceRecord CompleteRecord() {
    domain::InvoiceRecord record;
    record.invoiceNumber = "15";
    record.date = "2024-03-01";
    record.supplier = "ООО Энергосбыт";
    record.buyer = "ИП Петров";
    record.amount = 1000.0;
    record.vat = 200.0;
    record.vatRate = 20.0;
    return record;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConsistencyValidator Test..." << std::endl;
    ConsistencyValidator validator;

    // Consistent record
    {
        auto report = validator.Validate(CompleteRecord());
        assert(report.clean());
        assert(report.json["status"] == "pass");
        assert(report.json["warnings"].empty());
        assert(report.json["checks"]["required_fields"] == "ok");
        assert(report.json["checks"]["vat"] == "ok");
        std::cout << "[PASS] Consistent record passes." << std::endl;
    }

    // VAT mismatch is a warning, record untouched
    {
        auto record = CompleteRecord();
        record.vat = 250.0;
        const auto before = record;
        auto report = validator.Validate(record);
        assert(record == before);
        assert(report.missingFields.empty());
        assert(report.vatMismatch);
        assert(report.vatMismatch->expected == 200.0);
        assert(report.vatMismatch->actual == 250.0);
        assert(report.json["status"] == "pass-with-warnings");
        assert(report.json["checks"]["vat"] == "warning");
        assert(report.json["warnings"][0] == "VAT mismatch: expected 200, got 250");
        std::cout << "[PASS] VAT mismatch reported as a warning." << std::endl;
    }

    // Rounding to cents before comparison
    {
        auto record = CompleteRecord();
        record.amount = 33.33;
        record.vat = 6.67;
        assert(validator.Validate(record).clean());
        record.vat = 6.69;
        assert(validator.Validate(record).vatMismatch);
        std::cout << "[PASS] Expected VAT rounded to two decimals." << std::endl;
    }

    // Configurable tolerance
    {
        auto record = CompleteRecord();
        record.vat = 200.5;
        assert(validator.Validate(record).vatMismatch);
        assert(!ConsistencyValidator(1.0).Validate(record).vatMismatch);
    }

    // Missing fields; VAT check skipped without all three numbers
    {
        domain::InvoiceRecord record;
        record.amount = 100.0;
        record.vatRate = 20.0;
        auto report = validator.Validate(record);
        assert(report.missingFields.size() == 5);
        assert(report.missingFields[0] == "invoice_number");
        assert(report.missingFields.back() == "vat");
        assert(!report.vatMismatch);
        assert(report.json["checks"]["required_fields"] == "warning");
        assert(report.json["checks"]["vat"] == "skipped");
        assert(report.json["warnings"].size() == 5);
        assert(report.json["warnings"][0] == "Missing field: invoice_number");
        std::cout << "[PASS] Missing required fields reported." << std::endl;
    }

    // Optional fields are never required
    {
        auto record = CompleteRecord();
        assert(!record.contractNumber && !record.paymentDate && !record.meterNumber);
        assert(validator.Validate(record).missingFields.empty());
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
