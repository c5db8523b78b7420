/**
 * @file DocumentTextAcquirer.hpp
 * @brief Obtains document text from the embedded text layer, falling back to OCR.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "domain/DocumentPage.hpp"
#include "domain/DocumentPorts.hpp"

namespace invoiceauditor::application {

/**
 * @class DocumentTextAcquirer
 * @brief Two-tier text acquisition.
 *
 * Tier 1 reads the embedded text of every page. Only when the whole
 * document yields blank text does Tier 2 render each page, prepare the
 * bitmap and run recognition on it.
 */
class DocumentTextAcquirer {
public:
    /** @brief Fixed rendering resolution for recognition. */
    static constexpr int kRenderDpi = 150;

    using ImageFilter = std::function<domain::PageImage(const domain::PageImage&)>;

    /**
     * @param textLayer Embedded text reader.
     * @param renderers Candidate renderer backends in preference order; the
     *        first available one is selected once, here.
     * @param recognizer OCR engine.
     * @param preprocess Bitmap preparation applied before recognition.
     */
    DocumentTextAcquirer(std::shared_ptr<domain::TextLayerReader> textLayer,
                         std::vector<std::shared_ptr<domain::PageRenderer>> renderers,
                         std::shared_ptr<domain::TextRecognizer> recognizer,
                         ImageFilter preprocess);

    /**
     * @brief Acquires non-blank text for the document at @p path.
     * @throws domain::NotFoundError if the path does not exist.
     * @throws domain::ExtractionFailure if no tier yields text.
     */
    domain::ExtractedText acquire(const std::string& path);

    /** @brief Selected renderer backend, or null if none is available. */
    const std::shared_ptr<domain::PageRenderer>& renderer() const { return m_renderer; }

private:
    std::shared_ptr<domain::TextLayerReader> m_textLayer;
    std::shared_ptr<domain::PageRenderer> m_renderer;
    std::shared_ptr<domain::TextRecognizer> m_recognizer;
    ImageFilter m_preprocess;

    void readEmbedded(const std::string& path, domain::ExtractedText& out);
    void recognizePages(const std::string& path, domain::ExtractedText& out);
};

} // namespace invoiceauditor::application
