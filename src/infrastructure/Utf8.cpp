#include "infrastructure/Utf8.hpp"

namespace invoiceauditor::infrastructure {

namespace {

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::size_t Utf8::Decode(const std::string& text, std::size_t pos, char32_t& codePoint) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 1;
    char32_t value = lead;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        value = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        value = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        value = lead & 0x07;
    } else {
        codePoint = lead;
        return 1;
    }

    if (pos + length > text.size()) {
        codePoint = lead;
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if (!IsContinuation(c)) {
            codePoint = lead;
            return 1;
        }
        value = (value << 6) | (c & 0x3F);
    }
    codePoint = value;
    return length;
}

std::size_t Utf8::Length(const std::string& text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    char32_t cp = 0;
    while (pos < text.size()) {
        pos += Decode(text, pos, cp);
        ++count;
    }
    return count;
}

std::string Utf8::Truncate(const std::string& text, std::size_t maxCodePoints) {
    std::size_t count = 0;
    std::size_t pos = 0;
    char32_t cp = 0;
    while (pos < text.size() && count < maxCodePoints) {
        pos += Decode(text, pos, cp);
        ++count;
    }
    return text.substr(0, pos);
}

} // namespace invoiceauditor::infrastructure
