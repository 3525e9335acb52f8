// ImageUtils.hpp - 编解码相关的通用小工具
#ifndef IMAGE_UTILS_HPP
#define IMAGE_UTILS_HPP

#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace visionUtils {

// Decode an encoded image (jpeg/png/...) into a BGR Mat. Throws DecodeError.
cv::Mat decode_image(const std::vector<uchar>& bytes);

// JPEG encode with the given quality (0-100). Throws std::runtime_error on failure.
std::vector<uchar> encode_jpeg(const cv::Mat& image, int quality);

// "WxH"
std::string format_resolution(const cv::Mat& image);

// 保留两位小数
double round_to(double value, int digits);

} // namespace visionUtils

#endif // IMAGE_UTILS_HPP
