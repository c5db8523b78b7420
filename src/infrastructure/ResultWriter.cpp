// ResultWriter Implementation
#include "infrastructure/ResultWriter.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace invoiceauditor::infrastructure {

std::string ResultWriter::ResultPathFor(const std::string& documentPath, const std::string& outputDir) {
    const auto stem = std::filesystem::path(documentPath).stem().string();
    return (std::filesystem::path(outputDir) / (stem + "_audit_result.json")).string();
}

std::string ResultWriter::Render(const nlohmann::json& result) {
    return result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ResultWriter::Save(const nlohmann::json& result, const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << Render(result);
    if (!out) {
        throw std::runtime_error("Write failed: " + path);
    }
}

} // namespace invoiceauditor::infrastructure
