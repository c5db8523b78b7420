#include <cassert>
#include <iostream>
#include <string>

#include "application/ResponseRecoveryParser.hpp"

using namespace invoiceauditor::application;

int main() {
    std::cout << "[Test] Starting ResponseRecoveryParser Test..." << std::endl;
    ResponseRecoveryParser parser;

    // Tier 1: fenced, well-formed reply
    {
        auto result = parser.Recover(
            "```json\n{\"invoice_number\": \"А-17\", \"date\": \"2024-02-01\", "
            "\"amount\": 1000, \"vat\": 200, \"vat_rate\": 20, \"meter_number\": null}\n```");
        assert(result.tier == RecoveryTier::Strict);
        assert(result.record.invoiceNumber && *result.record.invoiceNumber == "А-17");
        assert(result.record.amount && *result.record.amount == 1000.0);
        assert(result.record.vatRate && *result.record.vatRate == 20.0);
        assert(!result.record.meterNumber);
        std::cout << "[PASS] Strict tier parses a fenced reply." << std::endl;
    }

    // Tier 0 isolates the object from surrounding chatter
    {
        auto result = parser.Recover("Вот результат: {\"supplier\": \"ООО Ромашка\"} Надеюсь, помог.");
        assert(result.tier == RecoveryTier::Strict);
        assert(result.candidate == "{\"supplier\": \"ООО Ромашка\"}");
        assert(result.record.supplier && *result.record.supplier == "ООО Ромашка");
        std::cout << "[PASS] Candidate cut at the outer braces." << std::endl;
    }

    // Tier 0 flattens a raw newline inside a string value
    {
        auto result = parser.Recover("{\n  \"supplier\": \"ООО\nРомашка\",\n  \"buyer\": \"ИП Петров\"\n}");
        assert(result.tier == RecoveryTier::Strict);
        assert(result.record.supplier && *result.record.supplier == "ООО Ромашка");
        assert(result.record.buyer && *result.record.buyer == "ИП Петров");
        std::cout << "[PASS] Embedded newline collapsed before parsing." << std::endl;
    }

    // Tier 2: trailing comma and single quotes
    {
        auto result = parser.Recover("{'invoice_number': '7', 'amount': 10.5,}");
        assert(result.tier == RecoveryTier::Repaired);
        assert(result.record.invoiceNumber && *result.record.invoiceNumber == "7");
        assert(result.record.amount && *result.record.amount == 10.5);
        assert(ResponseRecoveryParser::Repair("[1, 2,]") == "[1, 2]");
        assert(!ResponseRecoveryParser::TryStrict("{'a': 1}"));
        assert(ResponseRecoveryParser::TryRepaired("{'a': 1}"));
        std::cout << "[PASS] Repaired tier fixes commas and quoting." << std::endl;
    }

    // Tier 3: salvage from text that is not JSON at all
    {
        auto result = parser.Recover(
            "Номер: \"invoice_number\": \"42\", \"amount\": 1500.75, \"vat\": abc, "
            "\"vat_rate\": 1.2.3, \"contract_number\": null, \"meter_number\": \"\"");
        assert(result.tier == RecoveryTier::Salvaged);
        assert(result.record.invoiceNumber && *result.record.invoiceNumber == "42");
        assert(result.record.amount && *result.record.amount == 1500.75);
        assert(!result.record.vat && "Unmatched numeric stays unset");
        assert(!result.record.vatRate && "Unconvertible numeric stays unset");
        assert(!result.record.contractNumber);
        assert(!result.record.meterNumber);
        std::cout << "[PASS] Salvage tier picks individual fields." << std::endl;
    }

    // Salvage of a truncated object
    {
        auto result = parser.Recover("{\"invoice_number\": \"9\", \"supplier\": \"АО Сбыт\", \"amount\": 12");
        assert(result.tier == RecoveryTier::Salvaged);
        assert(result.record.invoiceNumber && *result.record.invoiceNumber == "9");
        assert(result.record.supplier && *result.record.supplier == "АО Сбыт");
        assert(result.record.amount && *result.record.amount == 12.0);
    }

    // Never throws, always yields a record
    {
        const std::string inputs[] = {"", "   ", "{{{", "}{", "[1, 2]", "null", "\"text\"",
                                      "```", "\xFF\xFE{\"date\":", "{\"amount\": \"\"}"};
        for (const auto& input : inputs) {
            auto result = parser.Recover(input);
            (void)result;
        }
        assert(parser.Recover("").record.IsEmpty());
        assert(parser.Recover("[1, 2]").record.IsEmpty());
        assert(parser.Recover("Извините, я не могу помочь.").record.IsEmpty());
        std::cout << "[PASS] Malformed input yields a best-effort record without throwing." << std::endl;
    }

    // Very long quoted values are scanned without deep recursion
    {
        const std::string longValue(100000, 'a');
        auto result = parser.Recover("{\"supplier\": \"" + longValue + "\nb\", \"amount\": 1}");
        assert(result.tier == RecoveryTier::Strict);
        assert(result.record.supplier && *result.record.supplier == longValue + " b");
        assert(result.record.amount && *result.record.amount == 1.0);

        const std::string isolated =
            ResponseRecoveryParser::IsolateCandidate("```json\n{\"buyer\": \"" + longValue + "\"}\n```");
        assert(isolated == "{\"buyer\": \"" + longValue + "\"}");

        auto salvaged = ResponseRecoveryParser::Salvage("\"supplier\": \"" + longValue + "\"");
        assert(salvaged.supplier && salvaged.supplier->size() == longValue.size());

        auto truncated = parser.Recover("{\"buyer\": \"" + longValue + std::string(50000, ' ') + "\n");
        assert(truncated.tier == RecoveryTier::Salvaged);
        assert(!truncated.record.buyer);
        std::cout << "[PASS] 100 KB values recovered without overflowing the stack." << std::endl;
    }

    assert(TierToString(RecoveryTier::Strict) == "strict");
    assert(TierToString(RecoveryTier::Repaired) == "repaired");
    assert(TierToString(RecoveryTier::Salvaged) == "salvaged");

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
