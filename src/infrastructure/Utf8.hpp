// Utf8 Header
#pragma once
#include <cstddef>
#include <string>

namespace invoiceauditor::infrastructure {

class Utf8 {
public:
    /**
     * @brief Decodes the code point starting at @p pos.
     * @param codePoint Receives the decoded value, or the raw byte for invalid input.
     * @return Number of bytes consumed (at least 1).
     */
    static std::size_t Decode(const std::string& text, std::size_t pos, char32_t& codePoint);

    /** @brief Number of code points in @p text. */
    static std::size_t Length(const std::string& text);

    /** @brief Prefix of @p text holding at most @p maxCodePoints code points. */
    static std::string Truncate(const std::string& text, std::size_t maxCodePoints);
};

} // namespace invoiceauditor::infrastructure
