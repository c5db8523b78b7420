#include "infrastructure/PopplerTextLayer.hpp"

#include <memory>
#include <stdexcept>

#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-page.h>

namespace invoiceauditor::infrastructure {

std::vector<domain::RawPage> PopplerTextLayer::readPages(const std::string& path) {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path));
    if (!doc) {
        throw std::runtime_error("poppler could not open " + path);
    }
    if (doc->is_locked()) {
        throw std::runtime_error("Document is locked: " + path);
    }

    std::vector<domain::RawPage> pages;
    const int count = doc->pages();
    pages.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        domain::RawPage raw;
        raw.index = i;
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (page) {
            poppler::byte_array utf8 = page->text().to_utf8();
            raw.embeddedText.assign(utf8.begin(), utf8.end());
        }
        pages.push_back(std::move(raw));
    }
    return pages;
}

} // namespace invoiceauditor::infrastructure
