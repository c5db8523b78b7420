/**
 * @file DocumentPorts.hpp
 * @brief Interfaces to the document text layer, page renderers and OCR engines.
 */

#pragma once

#include <string>
#include <vector>

#include "DocumentPage.hpp"

namespace invoiceauditor::domain {

/**
 * @class TextLayerReader
 * @brief Reads the embedded (selectable) text of each page.
 */
class TextLayerReader {
public:
    virtual ~TextLayerReader() = default;

    /**
     * @brief Returns one RawPage per page with @c embeddedText filled.
     * @throws std::runtime_error if the document cannot be opened.
     */
    virtual std::vector<RawPage> readPages(const std::string& path) = 0;
};

/**
 * @class PageRenderer
 * @brief Rasterizes document pages. Implementations are interchangeable.
 */
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    /** @brief Short backend name for logging. */
    virtual std::string name() const = 0;

    /** @brief Whether the backend can be used in this process. */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Renders every page at @p dpi. Each RawPage carries a bitmap.
     * @throws std::runtime_error if the document cannot be opened.
     */
    virtual std::vector<RawPage> renderPages(const std::string& path, int dpi) = 0;
};

/**
 * @class TextRecognizer
 * @brief Optical recognition of a prepared page bitmap.
 */
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;

    virtual std::string recognize(const PageImage& image) = 0;
};

} // namespace invoiceauditor::domain
