/**
 * @file TesseractRecognizer.cpp
 * @brief Implementation of TesseractRecognizer.
 */
#include "infrastructure/TesseractRecognizer.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

namespace invoiceauditor::infrastructure {

namespace {

struct PixDeleter {
    void operator()(Pix* pix) const { pixDestroy(&pix); }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

// Leptonica stores 8 bpp rows as big-endian 32-bit words; SET_DATA_BYTE handles the packing.
PixPtr ToPix(const domain::PageImage& image) {
    PixPtr pix(pixCreate(image.width, image.height, 8));
    if (!pix) {
        throw std::runtime_error("Leptonica could not allocate page image");
    }
    l_uint32* data = pixGetData(pix.get());
    const l_int32 wpl = pixGetWpl(pix.get());
    for (int y = 0; y < image.height; ++y) {
        l_uint32* line = data + y * wpl;
        const std::uint8_t* row = image.pixels.data() + static_cast<size_t>(y) * image.stride;
        for (int x = 0; x < image.width; ++x) {
            SET_DATA_BYTE(line, x, row[x]);
        }
    }
    return pix;
}

} // namespace

TesseractRecognizer::TesseractRecognizer(std::string languages, std::string tessdataPath, int sourceDpi)
    : m_languages(std::move(languages)),
      m_tessdataPath(std::move(tessdataPath)),
      m_sourceDpi(sourceDpi) {}

TesseractRecognizer::~TesseractRecognizer() {
    if (m_api) {
        m_api->End();
    }
}

bool TesseractRecognizer::initialize(std::string& errorMsg) {
    if (m_initialized) return true;

    m_api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = m_tessdataPath.empty() ? nullptr : m_tessdataPath.c_str();
    if (m_api->Init(datapath, m_languages.c_str(), tesseract::OEM_DEFAULT) != 0) {
        errorMsg = "Could not initialize Tesseract with languages '" + m_languages + "'";
        m_api.reset();
        return false;
    }
    m_api->SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
    m_initialized = true;
    std::cout << "[TesseractRecognizer] Engine ready (" << m_languages << ")" << std::endl;
    return true;
}

std::vector<std::string> TesseractRecognizer::availableLanguages() {
    std::vector<std::string> languages;
    std::string error;
    if (!initialize(error)) {
        std::cerr << "[TesseractRecognizer] " << error << std::endl;
        return languages;
    }
    m_api->GetAvailableLanguagesAsVector(&languages);
    return languages;
}

bool TesseractRecognizer::hasLanguage(const std::string& language) {
    const auto languages = availableLanguages();
    return std::find(languages.begin(), languages.end(), language) != languages.end();
}

std::string TesseractRecognizer::recognize(const domain::PageImage& image) {
    std::string error;
    if (!initialize(error)) {
        throw std::runtime_error(error);
    }
    if (image.empty()) {
        return "";
    }

    PixPtr pix;
    if (image.format == domain::PixelFormat::Gray8) {
        pix = ToPix(image);
        m_api->SetImage(pix.get());
    } else {
        m_api->SetImage(image.pixels.data(), image.width, image.height,
                        domain::BytesPerPixel(image.format), image.stride);
    }
    m_api->SetSourceResolution(m_sourceDpi);

    std::unique_ptr<char[]> text(m_api->GetUTF8Text());
    m_api->Clear();
    if (!text) {
        throw std::runtime_error("Tesseract returned no text");
    }
    return std::string(text.get());
}

} // namespace invoiceauditor::infrastructure
