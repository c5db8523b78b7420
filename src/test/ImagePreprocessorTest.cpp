#include <cassert>
#include <iostream>
#include <stdexcept>

#include "infrastructure/ImagePreprocessor.hpp"

using namespace invoiceauditor;
using infrastructure::ImagePreprocessor;

namespace {

// White page with a dark block in the middle.
domain::PageImage SyntheticPage(domain::PixelFormat format) {
    domain::PageImage page;
    page.width = 64;
    page.height = 48;
    page.format = format;
    const int bpp = domain::BytesPerPixel(format);
    page.stride = page.width * bpp + 4;
    page.pixels.assign(static_cast<size_t>(page.stride) * page.height, 0xFF);
    for (int y = 20; y < 28; ++y) {
        for (int x = 28; x < 36; ++x) {
            for (int c = 0; c < bpp; ++c) {
                if (format == domain::PixelFormat::Bgra32 && c == 3) continue;
                page.pixels[static_cast<size_t>(y) * page.stride + x * bpp + c] = 0x10;
            }
        }
    }
    return page;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ImagePreprocessor Test..." << std::endl;

    for (auto format : {domain::PixelFormat::Rgb24, domain::PixelFormat::Bgra32, domain::PixelFormat::Gray8}) {
        const auto input = SyntheticPage(format);
        const auto output = ImagePreprocessor::Process(input);
        assert(output.format == domain::PixelFormat::Gray8);
        assert(output.width == input.width && output.height == input.height);
        assert(output.stride == output.width);
        assert(output.pixels.size() == static_cast<size_t>(output.width) * output.height);
        assert(output.pixels[0] == 255 && "Blank margin stays white");

        const auto again = ImagePreprocessor::Process(input);
        assert(again.pixels == output.pixels && "Pipeline is deterministic");
    }
    std::cout << "[PASS] Every input layout becomes a same-size Gray8 bitmap." << std::endl;

    bool rejected = false;
    try {
        ImagePreprocessor::Process(domain::PageImage{});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    domain::PageImage shortBuffer = SyntheticPage(domain::PixelFormat::Rgb24);
    shortBuffer.pixels.resize(10);
    rejected = false;
    try {
        ImagePreprocessor::Process(shortBuffer);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Invalid bitmaps rejected." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
