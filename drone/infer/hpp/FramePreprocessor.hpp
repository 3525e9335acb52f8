#ifndef FRAME_PREPROCESSOR_HPP
#define FRAME_PREPROCESSOR_HPP

#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include "FrameTypes.hpp"

// 帧预处理模块 - 解码、限制分辨率、质量分析、CLAHE 增强、颜色转换
class FramePreprocessor {
public:
    struct Options {
        cv::Size maxFrameSize{1280, 720};
        bool enableClahe{true};
        bool enableQuality{true};
    };

    FramePreprocessor();

    // 从编码字节开始，解码失败抛 DecodeError
    PreparedFrame prepare(const std::vector<uchar>& rawBytes, const Options& options) const;

    // 已解码的 BGR 图像
    PreparedFrame prepare(const cv::Mat& bgrImage, const Options& options) const;

    double getClipLimit() const { return clipLimit; }
    cv::Size getTileGrid() const { return tileGrid; }

private:
    double clipLimit;
    cv::Size tileGrid;

    PreparedFrame prepareDecoded(const cv::Mat& bgrImage, const Options& options) const;
    cv::Mat resizeToFit(const cv::Mat& inputImage, const cv::Size& maxSize) const;
    cv::Mat applyClahe(const cv::Mat& bgrImage) const;
    cv::Mat convertBGRtoRGB(const cv::Mat& inputImage) const;
};

#endif // FRAME_PREPROCESSOR_HPP
