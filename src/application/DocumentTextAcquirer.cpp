/**
 * @file DocumentTextAcquirer.cpp
 * @brief Implementation of DocumentTextAcquirer.
 */

#include "application/DocumentTextAcquirer.hpp"
#include "domain/AuditErrors.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>

namespace invoiceauditor::application {

namespace {

bool IsBlank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

DocumentTextAcquirer::DocumentTextAcquirer(std::shared_ptr<domain::TextLayerReader> textLayer,
                                           std::vector<std::shared_ptr<domain::PageRenderer>> renderers,
                                           std::shared_ptr<domain::TextRecognizer> recognizer,
                                           ImageFilter preprocess)
    : m_textLayer(std::move(textLayer)),
      m_recognizer(std::move(recognizer)),
      m_preprocess(std::move(preprocess)) {
    for (auto& candidate : renderers) {
        if (candidate && candidate->isAvailable()) {
            m_renderer = candidate;
            std::cout << "[DocumentTextAcquirer] Renderer backend: " << m_renderer->name() << std::endl;
            break;
        }
        if (candidate) {
            std::cerr << "[DocumentTextAcquirer] Renderer " << candidate->name() << " unavailable." << std::endl;
        }
    }
    if (!m_preprocess) {
        m_preprocess = [](const domain::PageImage& image) { return image; };
    }
}

domain::ExtractedText DocumentTextAcquirer::acquire(const std::string& path) {
    std::filesystem::path p(path);
    if (!std::filesystem::exists(p)) {
        throw domain::NotFoundError("File not found: " + path);
    }

    std::cout << "[DocumentTextAcquirer] Processing: " << p.filename().string() << std::endl;

    domain::ExtractedText result;
    readEmbedded(path, result);

    if (IsBlank(result.content)) {
        result = domain::ExtractedText{};
        recognizePages(path, result);
    }

    if (IsBlank(result.content)) {
        throw domain::ExtractionFailure("Could not extract text from " + path);
    }

    const auto method = result.UsedRecognition() ? domain::AcquisitionMethod::Recognized
                                                 : domain::AcquisitionMethod::Embedded;
    std::cout << "[DocumentTextAcquirer] Extracted " << result.content.size() << " bytes ("
              << domain::MethodToString(method) << ")" << std::endl;
    return result;
}

void DocumentTextAcquirer::readEmbedded(const std::string& path, domain::ExtractedText& out) {
    std::cout << "[DocumentTextAcquirer] Reading embedded text..." << std::endl;
    if (!m_textLayer) return;

    std::vector<domain::RawPage> pages;
    try {
        pages = m_textLayer->readPages(path);
    } catch (const std::exception& e) {
        std::cerr << "[DocumentTextAcquirer] Text layer error: " << e.what() << std::endl;
        return;
    }

    for (const auto& page : pages) {
        if (!IsBlank(page.embeddedText)) {
            std::cout << "[DocumentTextAcquirer] Page " << (page.index + 1) << ": embedded text found" << std::endl;
            out.content += page.embeddedText + "\n";
            out.pages.push_back({page.index, domain::AcquisitionMethod::Embedded, page.embeddedText});
        } else {
            std::cerr << "[DocumentTextAcquirer] Page " << (page.index + 1) << ": no text" << std::endl;
        }
    }
}

void DocumentTextAcquirer::recognizePages(const std::string& path, domain::ExtractedText& out) {
    std::cout << "[DocumentTextAcquirer] Falling back to OCR..." << std::endl;
    if (!m_renderer) {
        throw domain::ExtractionFailure("No page renderer available for OCR fallback");
    }
    if (!m_recognizer) {
        throw domain::ExtractionFailure("No text recognizer available for OCR fallback");
    }

    std::vector<domain::RawPage> pages;
    try {
        pages = m_renderer->renderPages(path, kRenderDpi);
    } catch (const std::exception& e) {
        std::cerr << "[DocumentTextAcquirer] " << m_renderer->name() << " error: " << e.what() << std::endl;
        return;
    }

    const std::size_t total = pages.size();
    for (const auto& page : pages) {
        std::cout << "[DocumentTextAcquirer] Page " << (page.index + 1) << "/" << total
                  << " (" << m_renderer->name() << ")..." << std::endl;
        if (!page.bitmap || page.bitmap->empty()) {
            std::cerr << "[DocumentTextAcquirer] Page " << (page.index + 1) << ": render failed, skipped" << std::endl;
            continue;
        }
        try {
            const domain::PageImage prepared = m_preprocess(*page.bitmap);
            std::string text = m_recognizer->recognize(prepared);
            out.content += text + "\n";
            out.pages.push_back({page.index, domain::AcquisitionMethod::Recognized, std::move(text)});
        } catch (const std::exception& e) {
            std::cerr << "[DocumentTextAcquirer] Page " << (page.index + 1) << ": OCR error: " << e.what() << std::endl;
        }
    }
}

} // namespace invoiceauditor::application
