#include "infrastructure/PopplerPageRenderer.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-image.h>
#include <poppler/cpp/poppler-page-renderer.h>
#include <poppler/cpp/poppler-page.h>

namespace invoiceauditor::infrastructure {

bool PopplerPageRenderer::isAvailable() const {
    return poppler::page_renderer::can_render();
}

std::vector<domain::RawPage> PopplerPageRenderer::renderPages(const std::string& path, int dpi) {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path));
    if (!doc || doc->is_locked()) {
        throw std::runtime_error("poppler could not open " + path);
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    std::vector<domain::RawPage> pages;
    const int count = doc->pages();
    for (int i = 0; i < count; ++i) {
        domain::RawPage raw;
        raw.index = i;

        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            std::cerr << "[PopplerPageRenderer] Page " << (i + 1) << ": could not load" << std::endl;
            pages.push_back(std::move(raw));
            continue;
        }

        poppler::image image = renderer.render_page(page.get(), dpi, dpi);
        if (!image.is_valid() || image.format() != poppler::image::format_argb32) {
            std::cerr << "[PopplerPageRenderer] Page " << (i + 1) << ": render failed" << std::endl;
            pages.push_back(std::move(raw));
            continue;
        }

        // ARGB32 is stored native-endian, i.e. B,G,R,A bytes on little-endian hosts.
        domain::PageImage bitmap;
        bitmap.width = image.width();
        bitmap.height = image.height();
        bitmap.stride = image.bytes_per_row();
        bitmap.format = domain::PixelFormat::Bgra32;
        const auto size = static_cast<size_t>(bitmap.stride) * static_cast<size_t>(bitmap.height);
        bitmap.pixels.resize(size);
        std::memcpy(bitmap.pixels.data(), image.const_data(), size);

        raw.bitmap = std::move(bitmap);
        pages.push_back(std::move(raw));
    }
    return pages;
}

} // namespace invoiceauditor::infrastructure
