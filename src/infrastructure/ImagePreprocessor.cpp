#include "infrastructure/ImagePreprocessor.hpp"

#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

namespace invoiceauditor::infrastructure {

namespace {

cv::Mat ToGray(const domain::PageImage& page) {
    auto* data = const_cast<std::uint8_t*>(page.pixels.data());
    const auto step = static_cast<size_t>(page.stride);

    cv::Mat gray;
    switch (page.format) {
        case domain::PixelFormat::Gray8:
            gray = cv::Mat(page.height, page.width, CV_8UC1, data, step).clone();
            break;
        case domain::PixelFormat::Rgb24:
            cv::cvtColor(cv::Mat(page.height, page.width, CV_8UC3, data, step), gray, cv::COLOR_RGB2GRAY);
            break;
        case domain::PixelFormat::Bgra32:
            cv::cvtColor(cv::Mat(page.height, page.width, CV_8UC4, data, step), gray, cv::COLOR_BGRA2GRAY);
            break;
    }
    return gray;
}

} // namespace

domain::PageImage ImagePreprocessor::Process(const domain::PageImage& page) {
    if (page.empty()) {
        throw std::invalid_argument("ImagePreprocessor: empty page bitmap");
    }
    const auto needed = static_cast<size_t>(page.stride) * static_cast<size_t>(page.height);
    if (page.stride < page.width * domain::BytesPerPixel(page.format) || page.pixels.size() < needed) {
        throw std::invalid_argument("ImagePreprocessor: bitmap buffer smaller than its geometry");
    }

    cv::Mat gray = ToGray(page);

    auto clahe = cv::createCLAHE(kClaheClipLimit, cv::Size(kClaheTile, kClaheTile));
    clahe->apply(gray, gray);
    cv::convertScaleAbs(gray, gray, kGain, kBias);

    cv::Mat binary;
    cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY,
                          kThresholdBlock, kThresholdConstant);

    cv::Mat denoised;
    cv::fastNlMeansDenoising(binary, denoised, kDenoiseStrength, kDenoiseTemplate, kDenoiseSearch);

    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kCloseKernel, kCloseKernel));
    cv::morphologyEx(denoised, denoised, cv::MORPH_CLOSE, kernel);

    if (!denoised.isContinuous()) {
        denoised = denoised.clone();
    }

    domain::PageImage out;
    out.width = denoised.cols;
    out.height = denoised.rows;
    out.stride = denoised.cols;
    out.format = domain::PixelFormat::Gray8;
    out.pixels.assign(denoised.data, denoised.data + denoised.total());
    return out;
}

} // namespace invoiceauditor::infrastructure
