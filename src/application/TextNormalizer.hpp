/**
 * @file TextNormalizer.hpp
 * @brief Repairs recognition artifacts in extracted document text.
 */

#pragma once

#include <string>

namespace invoiceauditor::application {

/**
 * @class TextNormalizer
 * @brief Pure, idempotent text-to-text transform.
 *
 * Rules, in order:
 * 1. remove whitespace between two Cyrillic letters;
 * 2. remove whitespace before , . ; :
 * 3. repair known split tokens ("р уб" -> "руб", ...);
 * 4. collapse runs of spaces;
 * 5. trim.
 */
class TextNormalizer {
public:
    static std::string Normalize(const std::string& text);

    static std::string CollapseLetterSpacing(const std::string& text);
    static std::string RemoveSpaceBeforePunctuation(const std::string& text);
    static std::string RepairSplitTokens(const std::string& text);
    static std::string CollapseSpaces(const std::string& text);
    static std::string Trim(const std::string& text);
};

} // namespace invoiceauditor::application
