#include <cassert>
#include <iostream>

#include <nlohmann/json.hpp>

#include "domain/InvoiceRecord.hpp"

using namespace invoiceauditor::domain;

int main() {
    std::cout << "[Test] Starting InvoiceRecord Test..." << std::endl;

    // Empty record serializes every key as null
    InvoiceRecord empty;
    assert(empty.IsEmpty());
    auto emptyJson = empty.ToJson();
    assert(emptyJson.size() == InvoiceRecord::FieldNames.size());
    for (const auto* name : InvoiceRecord::FieldNames) {
        assert(emptyJson.contains(name) && emptyJson[name].is_null());
    }
    std::cout << "[PASS] Empty record emits all ten keys as null." << std::endl;

    // Coercion from a parsed object
    auto source = nlohmann::json::parse(R"({
        "invoice_number": 123,
        "date": "2024-03-01",
        "supplier": "",
        "buyer": "АО Энергосбыт",
        "amount": "1000.50",
        "vat": "около 200",
        "vat_rate": 20,
        "contract_number": null,
        "meter_number": ["x"],
        "comment": "ignored"
    })");
    InvoiceRecord record = InvoiceRecord::FromJson(source);
    assert(record.invoiceNumber && *record.invoiceNumber == "123");
    assert(record.date && *record.date == "2024-03-01");
    assert(!record.supplier && "Empty text means unset");
    assert(record.buyer && *record.buyer == "АО Энергосбыт");
    assert(record.amount && *record.amount == 1000.5);
    assert(!record.vat && "Non-numeric text leaves a numeric field unset");
    assert(record.vatRate && *record.vatRate == 20.0);
    assert(!record.contractNumber && !record.paymentDate && !record.meterNumber);
    assert(record.Has("amount") && !record.Has("vat") && !record.Has("unknown"));
    std::cout << "[PASS] FromJson coerces field types." << std::endl;

    // Non-object input yields an empty record
    assert(InvoiceRecord::FromJson(nlohmann::json::array({1, 2})).IsEmpty());

    // SetText routes numeric keys through strict conversion
    InvoiceRecord numeric;
    numeric.SetText("amount", "12.5");
    numeric.SetText("vat", "1.2.3");
    numeric.SetText("supplier", "ООО Ромашка");
    assert(numeric.amount && *numeric.amount == 12.5);
    assert(!numeric.vat);
    assert(numeric.supplier && *numeric.supplier == "ООО Ромашка");
    assert(!numeric.IsEmpty());

    auto json = numeric.ToJson();
    assert(json["amount"].get<double>() == 12.5);
    assert(json["vat"].is_null());
    assert(json["supplier"].get<std::string>() == "ООО Ромашка");
    assert(InvoiceRecord::FromJson(json) == numeric);
    std::cout << "[PASS] SetText and ToJson agree." << std::endl;

    // Diagnostic failure shape
    DiagnosticFailure failure;
    failure.rawReply = "not json";
    failure.sourceSample = "Счет";
    auto failureJson = failure.ToJson();
    assert(failureJson["error"] == "JSON parse failed");
    assert(failureJson["raw_response"] == "not json");
    assert(failureJson["extracted_text"] == "Счет");
    std::cout << "[PASS] DiagnosticFailure serializes its tag, reply and sample." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
