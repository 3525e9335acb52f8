#ifndef QUALITY_ANALYZER_HPP
#define QUALITY_ANALYZER_HPP

#include <opencv2/core.hpp>
#include "FrameTypes.hpp"

// 图像质量分析 - 纯函数，不修改输入
class QualityAnalyzer {
public:
    // 输入为 BGR（或单通道灰度）图像；空图抛 std::invalid_argument
    static QualityMetrics analyze(const cv::Mat& image);

private:
    static cv::Mat toGray(const cv::Mat& image);
};

#endif // QUALITY_ANALYZER_HPP
