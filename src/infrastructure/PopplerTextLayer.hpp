/**
 * @file PopplerTextLayer.hpp
 * @brief Embedded text reader backed by poppler-cpp.
 */

#pragma once

#include "domain/DocumentPorts.hpp"

namespace invoiceauditor::infrastructure {

class PopplerTextLayer : public domain::TextLayerReader {
public:
    std::vector<domain::RawPage> readPages(const std::string& path) override;
};

} // namespace invoiceauditor::infrastructure
