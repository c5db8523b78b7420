#include "infrastructure/MuPdfPageRenderer.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>

#include <mupdf/fitz.h>

namespace invoiceauditor::infrastructure {

namespace {

constexpr float kPdfPointsPerInch = 72.0f;

struct ContextGuard {
    fz_context* ctx = nullptr;
    fz_document* doc = nullptr;

    ContextGuard() : ctx(fz_new_context(nullptr, nullptr, FZ_STORE_UNLIMITED)) {}
    ~ContextGuard() {
        if (ctx) {
            fz_drop_document(ctx, doc);
            fz_drop_context(ctx);
        }
    }
    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;
};

domain::PageImage CopyPixmap(fz_context* ctx, fz_pixmap* pix) {
    domain::PageImage image;
    image.width = fz_pixmap_width(ctx, pix);
    image.height = fz_pixmap_height(ctx, pix);
    image.stride = static_cast<int>(fz_pixmap_stride(ctx, pix));
    image.format = fz_pixmap_components(ctx, pix) == 1 ? domain::PixelFormat::Gray8 : domain::PixelFormat::Rgb24;
    const auto size = static_cast<size_t>(image.stride) * static_cast<size_t>(image.height);
    image.pixels.resize(size);
    std::memcpy(image.pixels.data(), fz_pixmap_samples(ctx, pix), size);
    return image;
}

} // namespace

bool MuPdfPageRenderer::isAvailable() const {
    ContextGuard guard;
    return guard.ctx != nullptr;
}

std::vector<domain::RawPage> MuPdfPageRenderer::renderPages(const std::string& path, int dpi) {
    ContextGuard guard;
    fz_context* ctx = guard.ctx;
    if (!ctx) {
        throw std::runtime_error("Cannot create MuPDF context");
    }

    // Nothing that may throw a C++ exception runs inside fz_try.
    std::string error;
    int pageCount = 0;
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        guard.doc = fz_open_document(ctx, path.c_str());
        pageCount = fz_count_pages(ctx, guard.doc);
    }
    fz_catch(ctx) {
        error = fz_caught_message(ctx);
    }
    if (!error.empty()) {
        throw std::runtime_error("MuPDF could not open " + path + ": " + error);
    }

    const float zoom = static_cast<float>(dpi) / kPdfPointsPerInch;
    const fz_matrix transform = fz_scale(zoom, zoom);

    std::vector<domain::RawPage> pages;
    for (int i = 0; i < pageCount; ++i) {
        domain::RawPage raw;
        raw.index = i;

        fz_pixmap* pix = nullptr;
        const char* pageError = nullptr;
        fz_var(pix);
        fz_try(ctx) {
            pix = fz_new_pixmap_from_page_number(ctx, guard.doc, i, transform, fz_device_rgb(ctx), 0);
        }
        fz_catch(ctx) {
            pageError = fz_caught_message(ctx);
        }

        if (pix) {
            try {
                raw.bitmap = CopyPixmap(ctx, pix);
            } catch (...) {
                fz_drop_pixmap(ctx, pix);
                throw;
            }
            fz_drop_pixmap(ctx, pix);
        } else {
            std::cerr << "[MuPdfPageRenderer] Page " << (i + 1) << ": "
                      << (pageError ? pageError : "render failed") << std::endl;
        }
        pages.push_back(std::move(raw));
    }
    return pages;
}

} // namespace invoiceauditor::infrastructure
