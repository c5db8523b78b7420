/**
 * @file TextNormalizer.cpp
 * @brief Implementation of TextNormalizer.
 */

#include "application/TextNormalizer.hpp"
#include "infrastructure/Utf8.hpp"

#include <array>
#include <cctype>

namespace invoiceauditor::application {

using infrastructure::Utf8;

namespace {

struct SplitToken {
    const char* broken;
    const char* repaired;
    bool digitGuarded;  ///< Skip when a digit touches either side.
};

// Words the recognizer tends to break with a stray space.
const std::array<SplitToken, 6> kSplitTokens = {{
    {"о т", "от", true},
    {"р уб", "руб", false},
    {"э лектр", "электр", false},
    {"э нерг", "энерг", false},
    {"сч ё т", "счёт", false},
    {"о снаб", "оснаб", false},
}};

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsCyrillicLetter(char32_t cp) {
    return (cp >= 0x0410 && cp <= 0x044F) || cp == 0x0401 || cp == 0x0451;
}

bool IsPunctuation(char c) {
    return c == ',' || c == '.' || c == ';' || c == ':';
}

} // namespace

std::string TextNormalizer::Normalize(const std::string& text) {
    std::string out = CollapseLetterSpacing(text);
    out = RemoveSpaceBeforePunctuation(out);
    out = RepairSplitTokens(out);
    out = CollapseSpaces(out);
    return Trim(out);
}

std::string TextNormalizer::CollapseLetterSpacing(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool prevIsLetter = false;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (IsSpace(text[pos])) {
            std::size_t end = pos;
            while (end < text.size() && IsSpace(text[end])) ++end;
            bool nextIsLetter = false;
            if (end < text.size()) {
                char32_t cp = 0;
                Utf8::Decode(text, end, cp);
                nextIsLetter = IsCyrillicLetter(cp);
            }
            if (!(prevIsLetter && nextIsLetter)) {
                out.append(text, pos, end - pos);
            }
            prevIsLetter = false;
            pos = end;
            continue;
        }
        char32_t cp = 0;
        const std::size_t len = Utf8::Decode(text, pos, cp);
        out.append(text, pos, len);
        prevIsLetter = IsCyrillicLetter(cp);
        pos += len;
    }
    return out;
}

std::string TextNormalizer::RemoveSpaceBeforePunctuation(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (!IsSpace(text[pos])) {
            out.push_back(text[pos++]);
            continue;
        }
        std::size_t end = pos;
        while (end < text.size() && IsSpace(text[end])) ++end;
        if (end >= text.size() || !IsPunctuation(text[end])) {
            out.append(text, pos, end - pos);
        }
        pos = end;
    }
    return out;
}

std::string TextNormalizer::RepairSplitTokens(const std::string& text) {
    std::string out = text;
    for (const auto& token : kSplitTokens) {
        const std::string broken = token.broken;
        const std::string repaired = token.repaired;
        std::size_t pos = out.find(broken);
        while (pos != std::string::npos) {
            const std::size_t after = pos + broken.size();
            const bool touchesDigit = (pos > 0 && IsDigit(out[pos - 1])) ||
                                      (after < out.size() && IsDigit(out[after]));
            if (token.digitGuarded && touchesDigit) {
                pos = out.find(broken, pos + 1);
                continue;
            }
            out.replace(pos, broken.size(), repaired);
            pos = out.find(broken, pos + repaired.size());
        }
    }
    return out;
}

std::string TextNormalizer::CollapseSpaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == ' ' && !out.empty() && out.back() == ' ') continue;
        out.push_back(c);
    }
    return out;
}

std::string TextNormalizer::Trim(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size() && IsSpace(text[begin])) ++begin;
    std::size_t end = text.size();
    while (end > begin && IsSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

} // namespace invoiceauditor::application
