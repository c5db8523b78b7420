/**
 * @file PopplerPageRenderer.hpp
 * @brief Page rasterizer backed by poppler-cpp's page_renderer.
 */

#pragma once

#include "domain/DocumentPorts.hpp"

namespace invoiceauditor::infrastructure {

class PopplerPageRenderer : public domain::PageRenderer {
public:
    std::string name() const override { return "poppler"; }

    /** @brief True when poppler was built with a raster backend. */
    bool isAvailable() const override;

    std::vector<domain::RawPage> renderPages(const std::string& path, int dpi) override;
};

} // namespace invoiceauditor::infrastructure
