/**
 * @file ConsistencyValidator.hpp
 * @brief Non-blocking presence and VAT arithmetic checks for invoice records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/InvoiceRecord.hpp"

namespace invoiceauditor::application {

/**
 * @class ConsistencyValidator
 * @brief Reports missing required fields and VAT mismatches. Never blocks output.
 */
class ConsistencyValidator {
public:
    static constexpr double kDefaultVatTolerance = 0.01;

    struct VatMismatch {
        double expected = 0.0;
        double actual = 0.0;
    };

    struct Report {
        std::vector<std::string> missingFields;
        std::optional<VatMismatch> vatMismatch;
        nlohmann::json json;    ///< status, warnings[], checks{}

        bool clean() const { return missingFields.empty() && !vatMismatch; }
    };

    explicit ConsistencyValidator(double vatTolerance = kDefaultVatTolerance);

    /**
     * @brief Checks @p record and logs each observation.
     * @return Report of what was found. The record itself is never touched.
     */
    Report Validate(const domain::InvoiceRecord& record) const;

private:
    double m_vatTolerance;

    void AddWarning(nlohmann::json& report, const std::string& message) const;
    void SetCheck(nlohmann::json& report, const std::string& key, const std::string& status) const;
};

} // namespace invoiceauditor::application
