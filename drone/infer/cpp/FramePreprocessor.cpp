#include "../hpp/FramePreprocessor.hpp"
#include "../hpp/ImageUtils.hpp"
#include "../hpp/QualityAnalyzer.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

// ==================== FramePreprocessor 实现 ====================
FramePreprocessor::FramePreprocessor()
    : clipLimit(2.0), tileGrid(8, 8) {
}

PreparedFrame FramePreprocessor::prepare(const std::vector<uchar>& rawBytes, const Options& options) const {
    auto start = std::chrono::steady_clock::now();
    cv::Mat decoded = visionUtils::decode_image(rawBytes);
    PreparedFrame frame = prepareDecoded(decoded, options);
    frame.preprocessTimeMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    return frame;
}

PreparedFrame FramePreprocessor::prepare(const cv::Mat& bgrImage, const Options& options) const {
    if (bgrImage.empty() || bgrImage.channels() != 3) {
        throw std::invalid_argument("FramePreprocessor: expected a 3-channel BGR image");
    }
    auto start = std::chrono::steady_clock::now();
    PreparedFrame frame = prepareDecoded(bgrImage, options);
    frame.preprocessTimeMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    return frame;
}

PreparedFrame FramePreprocessor::prepareDecoded(const cv::Mat& bgrImage, const Options& options) const {
    PreparedFrame frame;

    // 1) 超过最大分辨率时按比例缩小
    frame.resizedBgr = resizeToFit(bgrImage, options.maxFrameSize);
    frame.resolution = visionUtils::format_resolution(frame.resizedBgr);

    // 2) 质量指标必须在增强之前计算
    if (options.enableQuality) {
        frame.quality = QualityAnalyzer::analyze(frame.resizedBgr);
    }

    // 3) 只对亮度通道做 CLAHE
    frame.enhancedBgr = options.enableClahe ? applyClahe(frame.resizedBgr) : frame.resizedBgr;

    // 4) 模型需要 RGB
    frame.modelInput = convertBGRtoRGB(frame.enhancedBgr);
    return frame;
}

cv::Mat FramePreprocessor::resizeToFit(const cv::Mat& inputImage, const cv::Size& maxSize) const {
    const int w = inputImage.cols;
    const int h = inputImage.rows;
    if (w <= maxSize.width && h <= maxSize.height) {
        return inputImage;
    }
    const double scale = std::min(static_cast<double>(maxSize.width) / w,
                                  static_cast<double>(maxSize.height) / h);
    const int newW = std::max(1, static_cast<int>(w * scale));
    const int newH = std::max(1, static_cast<int>(h * scale));

    cv::Mat resized;
    cv::resize(inputImage, resized, cv::Size(newW, newH), 0, 0, cv::INTER_AREA);
    return resized;
}

cv::Mat FramePreprocessor::applyClahe(const cv::Mat& bgrImage) const {
    cv::Mat lab;
    cv::cvtColor(bgrImage, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> planes;
    cv::split(lab, planes);

    // L 通道增强，a/b 保持不变
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(clipLimit, tileGrid);
    cv::Mat lEnhanced;
    clahe->apply(planes[0], lEnhanced);
    planes[0] = lEnhanced;

    cv::Mat merged, enhanced;
    cv::merge(planes, merged);
    cv::cvtColor(merged, enhanced, cv::COLOR_Lab2BGR);
    return enhanced;
}

cv::Mat FramePreprocessor::convertBGRtoRGB(const cv::Mat& inputImage) const {
    cv::Mat rgbImage;
    cv::cvtColor(inputImage, rgbImage, cv::COLOR_BGR2RGB);
    return rgbImage;
}
