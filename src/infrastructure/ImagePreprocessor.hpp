/**
 * @file ImagePreprocessor.hpp
 * @brief OpenCV pipeline that prepares a rendered page for recognition.
 */

#pragma once

#include "domain/DocumentPage.hpp"

namespace invoiceauditor::infrastructure {

class ImagePreprocessor {
public:
    static constexpr double kClaheClipLimit = 2.0;
    static constexpr int kClaheTile = 8;
    static constexpr double kGain = 1.8;
    static constexpr double kBias = 10.0;
    static constexpr int kThresholdBlock = 15;
    static constexpr double kThresholdConstant = 3.0;
    static constexpr float kDenoiseStrength = 10.0f;
    static constexpr int kDenoiseTemplate = 7;
    static constexpr int kDenoiseSearch = 21;
    static constexpr int kCloseKernel = 2;

    /**
     * @brief Luminance, CLAHE, gain/bias, adaptive threshold, denoise, closing.
     * @return A Gray8 bitmap of the same size as @p page.
     * @throws std::invalid_argument if @p page is empty.
     */
    static domain::PageImage Process(const domain::PageImage& page);
};

} // namespace invoiceauditor::infrastructure
