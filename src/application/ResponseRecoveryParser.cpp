/**
 * @file ResponseRecoveryParser.cpp
 * @brief Implementation of ResponseRecoveryParser.
 */

#include "application/ResponseRecoveryParser.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace invoiceauditor::application {

using json = nlohmann::json;

namespace {

// Scanning stays iterative: std::regex recursion depth grows with match length.
bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::size_t SkipSpace(const std::string& s, std::size_t pos) {
    while (pos < s.size() && IsSpace(s[pos])) ++pos;
    return pos;
}

std::string TrimWhitespace(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Drops ``` and ```json markers together with the whitespace that follows them.
std::string StripFences(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto fence = text.find("```", pos);
        if (fence == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, fence - pos);
        pos = fence + 3;
        if (text.compare(pos, 4, "json") == 0) pos += 4;
        pos = SkipSpace(text, pos);
    }
    return out;
}

// Position just past `: "` when a key-closing quote at @p quote opens a string
// value, npos otherwise.
std::size_t StringValueStart(const std::string& s, std::size_t quote) {
    std::size_t pos = SkipSpace(s, quote + 1);
    if (pos >= s.size() || s[pos] != ':') return std::string::npos;
    pos = SkipSpace(s, pos + 1);
    if (pos >= s.size() || s[pos] != '"') return std::string::npos;
    return pos + 1;
}

// A raw newline inside a string value becomes a space; the colon is rewritten
// as `": "`.
std::string FlattenValueNewlines(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    std::size_t pos = 0;
    while (pos < s.size()) {
        if (s[pos] == '"') {
            const auto valueStart = StringValueStart(s, pos);
            const auto valueEnd = valueStart == std::string::npos ? std::string::npos : s.find('"', valueStart);
            if (valueEnd != std::string::npos) {
                std::string value = s.substr(valueStart, valueEnd - valueStart);
                const auto newline = value.rfind('\n');
                if (newline != std::string::npos) {
                    value[newline] = ' ';
                    out += "\": \"";
                    out += value;
                    out += '"';
                    pos = valueEnd + 1;
                    continue;
                }
            }
        }
        out += s[pos++];
    }
    return out;
}

std::string CollapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t pos = 0; pos < s.size();) {
        if (IsSpace(s[pos])) {
            out += ' ';
            pos = SkipSpace(s, pos);
        } else {
            out += s[pos++];
        }
    }
    return out;
}

// ", }" -> "}" and ", ]" -> "]".
std::string DropTrailingCommas(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t pos = 0; pos < s.size();) {
        if (s[pos] == ',') {
            const auto next = SkipSpace(s, pos + 1);
            if (next < s.size() && (s[next] == '}' || s[next] == ']')) {
                pos = next;
                continue;
            }
        }
        out += s[pos++];
    }
    return out;
}

bool IsNullable(const std::string& field) {
    for (const auto* nullable : domain::InvoiceRecord::NullableFields) {
        if (field == nullable) return true;
    }
    return false;
}

/**
 * First occurrence of `"field": value` in @p text. Numeric fields take a run
 * of digits and dots, text fields a quoted string, nullable fields also accept
 * a bare null. Returns nullopt when absent or when the first match is null.
 */
std::optional<std::string> FindFieldValue(const std::string& text, const std::string& field) {
    const std::string key = "\"" + field + "\"";
    const bool numeric = domain::InvoiceRecord::IsNumericField(field);
    const bool nullable = IsNullable(field);

    for (auto at = text.find(key); at != std::string::npos; at = text.find(key, at + 1)) {
        std::size_t pos = SkipSpace(text, at + key.size());
        if (pos >= text.size() || text[pos] != ':') continue;
        pos = SkipSpace(text, pos + 1);
        if (pos >= text.size()) continue;

        if (numeric) {
            const auto end = text.find_first_not_of("0123456789.", pos);
            const auto stop = end == std::string::npos ? text.size() : end;
            if (stop > pos) return text.substr(pos, stop - pos);
            continue;
        }
        if (text[pos] == '"') {
            const auto close = text.find('"', pos + 1);
            if (close != std::string::npos) return text.substr(pos + 1, close - pos - 1);
            continue;
        }
        if (nullable && text.compare(pos, 4, "null") == 0) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<domain::InvoiceRecord> ParseObject(const std::string& text) {
    try {
        auto parsed = json::parse(text);
        if (!parsed.is_object()) {
            std::cerr << "[ResponseRecoveryParser] Reply is not a JSON object." << std::endl;
            return std::nullopt;
        }
        return domain::InvoiceRecord::FromJson(parsed);
    } catch (const json::parse_error& e) {
        std::cerr << "[ResponseRecoveryParser] JSON decode error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace

std::string TierToString(RecoveryTier tier) {
    switch (tier) {
        case RecoveryTier::Strict: return "strict";
        case RecoveryTier::Repaired: return "repaired";
        case RecoveryTier::Salvaged: return "salvaged";
        default: return "unknown";
    }
}

ResponseRecoveryParser::Recovery ResponseRecoveryParser::Recover(const std::string& reply) const {
    Recovery result;
    result.candidate = IsolateCandidate(reply);

    if (auto record = TryStrict(result.candidate)) {
        result.record = std::move(*record);
        result.tier = RecoveryTier::Strict;
        return result;
    }

    // Salvage runs on the repaired text so single-quoted replies still match.
    const std::string repaired = Repair(result.candidate);
    if (auto record = ParseObject(repaired)) {
        result.record = std::move(*record);
        result.tier = RecoveryTier::Repaired;
        return result;
    }

    result.record = Salvage(repaired);
    result.tier = RecoveryTier::Salvaged;
    return result;
}

std::string ResponseRecoveryParser::IsolateCandidate(const std::string& reply) {
    std::string text = TrimWhitespace(StripFences(reply));

    const auto start = text.find('{');
    const auto end = text.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return text;
    }

    std::string candidate = text.substr(start, end - start + 1);
    return CollapseWhitespace(FlattenValueNewlines(candidate));
}

std::optional<domain::InvoiceRecord> ResponseRecoveryParser::TryStrict(const std::string& candidate) {
    return ParseObject(candidate);
}

std::string ResponseRecoveryParser::Repair(const std::string& candidate) {
    std::string repaired = DropTrailingCommas(candidate);
    for (char& c : repaired) {
        if (c == '\'') c = '"';
    }
    return repaired;
}

std::optional<domain::InvoiceRecord> ResponseRecoveryParser::TryRepaired(const std::string& candidate) {
    return ParseObject(Repair(candidate));
}

domain::InvoiceRecord ResponseRecoveryParser::Salvage(const std::string& text) {
    domain::InvoiceRecord record;
    for (const auto* name : domain::InvoiceRecord::FieldNames) {
        if (auto value = FindFieldValue(text, name)) {
            // SetText leaves numeric fields unset when conversion fails.
            record.SetText(name, *value);
        }
    }
    return record;
}

} // namespace invoiceauditor::application
