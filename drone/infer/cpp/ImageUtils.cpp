#include "../hpp/ImageUtils.hpp"
#include "../hpp/VisionErrors.hpp"
#include <cmath>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>

namespace visionUtils {

cv::Mat decode_image(const std::vector<uchar>& bytes) {
    if (bytes.empty()) {
        throw DecodeError("Failed to decode image: empty buffer");
    }
    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Failed to decode image: ") + e.what());
    }
    if (image.empty()) {
        throw DecodeError("Failed to decode image");
    }
    return image;
}

std::vector<uchar> encode_jpeg(const cv::Mat& image, int quality) {
    std::vector<uchar> buffer;
    if (image.empty() || !cv::imencode(".jpg", image, buffer, {cv::IMWRITE_JPEG_QUALITY, quality})) {
        throw std::runtime_error("Failed to encode jpeg");
    }
    return buffer;
}

std::string format_resolution(const cv::Mat& image) {
    return std::to_string(image.cols) + "x" + std::to_string(image.rows);
}

double round_to(double value, int digits) {
    const double factor = std::pow(10.0, digits);
    return std::round(value * factor) / factor;
}

} // namespace visionUtils
