/**
 * @file ConsistencyValidator.cpp
 * @brief Implementation of ConsistencyValidator.
 */

#include "application/ConsistencyValidator.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace invoiceauditor::application {

namespace {

double RoundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

ConsistencyValidator::ConsistencyValidator(double vatTolerance)
    : m_vatTolerance(vatTolerance) {}

void ConsistencyValidator::AddWarning(nlohmann::json& report, const std::string& message) const {
    report["warnings"].push_back(message);
    std::cerr << "[ConsistencyValidator] " << message << std::endl;
}

void ConsistencyValidator::SetCheck(nlohmann::json& report, const std::string& key, const std::string& status) const {
    report["checks"][key] = status;
}

ConsistencyValidator::Report ConsistencyValidator::Validate(const domain::InvoiceRecord& record) const {
    Report result;
    nlohmann::json report = {
        {"status", "pass"},
        {"warnings", nlohmann::json::array()},
        {"checks", nlohmann::json::object()}
    };

    // A) Required fields
    for (const auto* field : domain::InvoiceRecord::RequiredFields) {
        if (!record.Has(field)) {
            result.missingFields.emplace_back(field);
            AddWarning(report, std::string("Missing field: ") + field);
        }
    }
    SetCheck(report, "required_fields", result.missingFields.empty() ? "ok" : "warning");

    // B) VAT arithmetic
    if (record.amount && record.vat && record.vatRate) {
        const double expected = RoundToCents(*record.amount * *record.vatRate / 100.0);
        if (std::fabs(*record.vat - expected) > m_vatTolerance) {
            result.vatMismatch = VatMismatch{expected, *record.vat};
            AddWarning(report, "VAT mismatch: expected " + FormatNumber(expected) +
                                   ", got " + FormatNumber(*record.vat));
            SetCheck(report, "vat", "warning");
        } else {
            SetCheck(report, "vat", "ok");
        }
    } else {
        SetCheck(report, "vat", "skipped");
    }

    report["status"] = report["warnings"].empty() ? "pass" : "pass-with-warnings";
    result.json = std::move(report);
    return result;
}

} // namespace invoiceauditor::application
