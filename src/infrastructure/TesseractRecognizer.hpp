#pragma once

#include "domain/DocumentPorts.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tesseract {
class TessBaseAPI;
}

namespace invoiceauditor::infrastructure {

/**
 * @class TesseractRecognizer
 * @brief OCR through the Tesseract LSTM engine with a mixed-language dictionary.
 *
 * The engine is initialized lazily on first use and reused for every page.
 */
class TesseractRecognizer : public domain::TextRecognizer {
public:
    /**
     * @param languages Tesseract language string, e.g. "rus+eng".
     * @param tessdataPath Directory holding traineddata files; empty for the default.
     * @param sourceDpi Resolution the pages were rendered at.
     */
    TesseractRecognizer(std::string languages, std::string tessdataPath, int sourceDpi);
    ~TesseractRecognizer() override;

    TesseractRecognizer(const TesseractRecognizer&) = delete;
    TesseractRecognizer& operator=(const TesseractRecognizer&) = delete;

    /** @throws std::runtime_error if the engine cannot be initialized. */
    std::string recognize(const domain::PageImage& image) override;

    /** @brief Loads the engine. Returns false and fills @p errorMsg on failure. */
    bool initialize(std::string& errorMsg);

    /** @brief Languages the loaded engine has traineddata for. */
    std::vector<std::string> availableLanguages();

    bool hasLanguage(const std::string& language);

private:
    std::string m_languages;
    std::string m_tessdataPath;
    int m_sourceDpi;
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
    bool m_initialized = false;
};

} // namespace invoiceauditor::infrastructure
