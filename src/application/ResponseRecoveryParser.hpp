/**
 * @file ResponseRecoveryParser.hpp
 * @brief Recovers an InvoiceRecord from a free-form completion reply.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/InvoiceRecord.hpp"

namespace invoiceauditor::application {

/**
 * @enum RecoveryTier
 * @brief Fallback stage that produced the record.
 */
enum class RecoveryTier {
    Strict,     ///< Tier 1: candidate parsed as-is.
    Repaired,   ///< Tier 2: parsed after comma/quote repair.
    Salvaged    ///< Tier 3: field-by-field salvage.
};

std::string TierToString(RecoveryTier tier);

/**
 * @class ResponseRecoveryParser
 * @brief Tiered recovery parser. Never throws; always yields a record.
 *
 * Tier 0 isolates the JSON-looking candidate and flattens newlines. Tiers 1-3
 * run in order and the first that succeeds wins. Tier 3 is the floor and
 * cannot fail, so the result may simply have every field unset.
 */
class ResponseRecoveryParser {
public:
    struct Recovery {
        domain::InvoiceRecord record;
        RecoveryTier tier = RecoveryTier::Salvaged;
        std::string candidate;  ///< Tier-0 output.
    };

    Recovery Recover(const std::string& reply) const;

    /** @brief Tier 0: strip fences, cut to outer braces, flatten newlines. */
    static std::string IsolateCandidate(const std::string& reply);

    /** @brief Tier 1: strict parse of the candidate. */
    static std::optional<domain::InvoiceRecord> TryStrict(const std::string& candidate);

    /** @brief Tier 2 text repair: drop trailing commas, single to double quotes. */
    static std::string Repair(const std::string& candidate);

    /** @brief Tier 2: parse after Repair(). */
    static std::optional<domain::InvoiceRecord> TryRepaired(const std::string& candidate);

    /** @brief Tier 3: per-field salvage of `"key": value` pairs. Always returns a record. */
    static domain::InvoiceRecord Salvage(const std::string& text);
};

} // namespace invoiceauditor::application
