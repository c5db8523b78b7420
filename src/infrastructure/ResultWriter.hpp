// ResultWriter Header
#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace invoiceauditor::infrastructure {

class ResultWriter {
public:
    /** @brief "<stem>_audit_result.json" in @p outputDir for the document at @p documentPath. */
    static std::string ResultPathFor(const std::string& documentPath, const std::string& outputDir);

    /** @brief Pretty JSON, non-ASCII kept as UTF-8, invalid bytes replaced. */
    static std::string Render(const nlohmann::json& result);

    /** @throws std::runtime_error if the file cannot be written. */
    static void Save(const nlohmann::json& result, const std::string& path);
};

} // namespace invoiceauditor::infrastructure
