/**
 * @file InvoiceRecord.cpp
 * @brief Implementation of InvoiceRecord.
 */

#include "domain/InvoiceRecord.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace invoiceauditor::domain {

namespace {

std::optional<std::string>* TextSlot(InvoiceRecord& r, const std::string& field) {
    if (field == "invoice_number") return &r.invoiceNumber;
    if (field == "date") return &r.date;
    if (field == "supplier") return &r.supplier;
    if (field == "buyer") return &r.buyer;
    if (field == "contract_number") return &r.contractNumber;
    if (field == "payment_date") return &r.paymentDate;
    if (field == "meter_number") return &r.meterNumber;
    return nullptr;
}

std::optional<double>* NumberSlot(InvoiceRecord& r, const std::string& field) {
    if (field == "amount") return &r.amount;
    if (field == "vat") return &r.vat;
    if (field == "vat_rate") return &r.vatRate;
    return nullptr;
}

std::optional<double> ToReal(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
nlohmann::json OrNull(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // namespace

bool InvoiceRecord::IsEmpty() const {
    return !invoiceNumber && !date && !supplier && !buyer && !amount && !vat &&
           !vatRate && !contractNumber && !paymentDate && !meterNumber;
}

bool InvoiceRecord::Has(const std::string& field) const {
    if (field == "invoice_number") return invoiceNumber.has_value();
    if (field == "date") return date.has_value();
    if (field == "supplier") return supplier.has_value();
    if (field == "buyer") return buyer.has_value();
    if (field == "amount") return amount.has_value();
    if (field == "vat") return vat.has_value();
    if (field == "vat_rate") return vatRate.has_value();
    if (field == "contract_number") return contractNumber.has_value();
    if (field == "payment_date") return paymentDate.has_value();
    if (field == "meter_number") return meterNumber.has_value();
    return false;
}

bool InvoiceRecord::IsNumericField(const std::string& field) {
    for (const auto* name : NumericFields) {
        if (field == name) return true;
    }
    return false;
}

void InvoiceRecord::SetText(const std::string& field, const std::string& value) {
    if (auto* slot = TextSlot(*this, field)) {
        if (value.empty()) {
            slot->reset();
        } else {
            *slot = value;
        }
        return;
    }
    if (auto* slot = NumberSlot(*this, field)) {
        *slot = ToReal(value);
    }
}

void InvoiceRecord::SetNumber(const std::string& field, double value) {
    if (auto* slot = NumberSlot(*this, field)) {
        *slot = value;
    }
}

nlohmann::json InvoiceRecord::ToJson() const {
    return {
        {"invoice_number", OrNull(invoiceNumber)},
        {"date", OrNull(date)},
        {"supplier", OrNull(supplier)},
        {"buyer", OrNull(buyer)},
        {"amount", OrNull(amount)},
        {"vat", OrNull(vat)},
        {"vat_rate", OrNull(vatRate)},
        {"contract_number", OrNull(contractNumber)},
        {"payment_date", OrNull(paymentDate)},
        {"meter_number", OrNull(meterNumber)}
    };
}

InvoiceRecord InvoiceRecord::FromJson(const nlohmann::json& object) {
    InvoiceRecord record;
    if (!object.is_object()) return record;

    for (const auto* name : FieldNames) {
        auto it = object.find(name);
        if (it == object.end() || it->is_null()) continue;

        const std::string field = name;
        if (IsNumericField(field)) {
            if (it->is_number()) {
                record.SetNumber(field, it->get<double>());
            } else if (it->is_string()) {
                record.SetText(field, it->get<std::string>());
            }
        } else {
            if (it->is_string()) {
                record.SetText(field, it->get<std::string>());
            } else if (it->is_number()) {
                record.SetText(field, it->dump());
            }
        }
    }
    return record;
}

bool InvoiceRecord::operator==(const InvoiceRecord& other) const {
    return invoiceNumber == other.invoiceNumber && date == other.date &&
           supplier == other.supplier && buyer == other.buyer &&
           amount == other.amount && vat == other.vat && vatRate == other.vatRate &&
           contractNumber == other.contractNumber && paymentDate == other.paymentDate &&
           meterNumber == other.meterNumber;
}

} // namespace invoiceauditor::domain
