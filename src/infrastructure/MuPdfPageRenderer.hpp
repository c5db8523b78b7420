/**
 * @file MuPdfPageRenderer.hpp
 * @brief Page rasterizer backed by MuPDF (preferred backend).
 */

#pragma once

#include "domain/DocumentPorts.hpp"

namespace invoiceauditor::infrastructure {

class MuPdfPageRenderer : public domain::PageRenderer {
public:
    std::string name() const override { return "mupdf"; }

    /** @brief True when a MuPDF context can be created. */
    bool isAvailable() const override;

    /**
     * @brief Renders every page to an RGB pixmap at @p dpi.
     *
     * A page that fails to render yields a RawPage without bitmap.
     * @throws std::runtime_error if the document cannot be opened.
     */
    std::vector<domain::RawPage> renderPages(const std::string& path, int dpi) override;
};

} // namespace invoiceauditor::infrastructure
