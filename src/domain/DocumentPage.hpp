/**
 * @file DocumentPage.hpp
 * @brief Per-page values produced while acquiring document text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace invoiceauditor::domain {

/**
 * @enum PixelFormat
 * @brief Memory layout of a page bitmap.
 */
enum class PixelFormat {
    Gray8,
    Rgb24,
    Bgra32
};

inline int BytesPerPixel(PixelFormat format) {
    switch (format) {
        case PixelFormat::Gray8: return 1;
        case PixelFormat::Rgb24: return 3;
        case PixelFormat::Bgra32: return 4;
    }
    return 1;
}

/**
 * @struct PageImage
 * @brief Rendered page bitmap, rows packed at @c stride bytes.
 */
struct PageImage {
    int width = 0;
    int height = 0;
    int stride = 0;
    PixelFormat format = PixelFormat::Gray8;
    std::vector<std::uint8_t> pixels;

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

/**
 * @struct RawPage
 * @brief One page as read from the document: embedded text or a bitmap.
 */
struct RawPage {
    int index = 0;
    std::string embeddedText;
    std::optional<PageImage> bitmap;
};

/**
 * @enum AcquisitionMethod
 * @brief How the text of a page was obtained.
 */
enum class AcquisitionMethod {
    Embedded,
    Recognized
};

inline std::string MethodToString(AcquisitionMethod method) {
    switch (method) {
        case AcquisitionMethod::Embedded: return "embedded";
        case AcquisitionMethod::Recognized: return "recognized";
        default: return "unknown";
    }
}

/**
 * @struct PageText
 * @brief Text contributed by one page.
 */
struct PageText {
    int index = 0;
    AcquisitionMethod method = AcquisitionMethod::Embedded;
    std::string text;
};

/**
 * @struct ExtractedText
 * @brief Concatenated text of a document plus per-page provenance.
 */
struct ExtractedText {
    std::string content;
    std::vector<PageText> pages;

    bool UsedRecognition() const {
        for (const auto& page : pages) {
            if (page.method == AcquisitionMethod::Recognized) return true;
        }
        return false;
    }
};

} // namespace invoiceauditor::domain
