/**
 * @file InvoiceRecord.hpp
 * @brief Structured invoice record recovered from a completion reply.
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace invoiceauditor::domain {

/**
 * @class InvoiceRecord
 * @brief Fixed-shape record with ten optional fields.
 *
 * Every field may be unset. Serialization always emits all ten keys,
 * using null for unset values.
 */
class InvoiceRecord {
public:
    std::optional<std::string> invoiceNumber;   ///< "invoice_number"
    std::optional<std::string> date;            ///< "date", ISO 8601.
    std::optional<std::string> supplier;        ///< "supplier"
    std::optional<std::string> buyer;           ///< "buyer"
    std::optional<double> amount;               ///< "amount", net of tax.
    std::optional<double> vat;                  ///< "vat", tax amount.
    std::optional<double> vatRate;              ///< "vat_rate", percent.
    std::optional<std::string> contractNumber;  ///< "contract_number"
    std::optional<std::string> paymentDate;     ///< "payment_date"
    std::optional<std::string> meterNumber;     ///< "meter_number"

    /** @brief JSON key names in prompt order. */
    static constexpr std::array<const char*, 10> FieldNames = {
        "invoice_number", "date", "supplier", "buyer", "amount",
        "vat", "vat_rate", "contract_number", "payment_date", "meter_number"
    };

    /** @brief Fields whose absence is reported by validation. */
    static constexpr std::array<const char*, 6> RequiredFields = {
        "invoice_number", "date", "supplier", "buyer", "amount", "vat"
    };

    /** @brief Fields holding real numbers. */
    static constexpr std::array<const char*, 3> NumericFields = {
        "amount", "vat", "vat_rate"
    };

    /** @brief Fields the prompt declares as "string or null". */
    static constexpr std::array<const char*, 3> NullableFields = {
        "contract_number", "payment_date", "meter_number"
    };

    /** @brief True when no field is set. */
    bool IsEmpty() const;

    /** @brief True when the named field holds a value. */
    bool Has(const std::string& field) const;

    /** @brief Assigns a text field by key. Empty text leaves the field unset. */
    void SetText(const std::string& field, const std::string& value);

    /** @brief Assigns a numeric field by key. */
    void SetNumber(const std::string& field, double value);

    nlohmann::json ToJson() const;

    /**
     * @brief Builds a record from a parsed JSON object.
     *
     * Unknown keys are ignored. Values of the wrong type leave the field unset.
     */
    static InvoiceRecord FromJson(const nlohmann::json& object);

    bool operator==(const InvoiceRecord& other) const;

    static bool IsNumericField(const std::string& field);
};

/**
 * @struct DiagnosticFailure
 * @brief Terminal value produced when no usable record could be recovered.
 */
struct DiagnosticFailure {
    std::string errorTag = "JSON parse failed";
    std::string rawReply;
    std::string sourceSample;   ///< Truncated normalized source text.

    nlohmann::json ToJson() const {
        return {
            {"error", errorTag},
            {"raw_response", rawReply},
            {"extracted_text", sourceSample}
        };
    }
};

/** @brief Either a recovered record or the diagnostic failure. */
using CompletionResult = std::variant<InvoiceRecord, DiagnosticFailure>;

} // namespace invoiceauditor::domain
