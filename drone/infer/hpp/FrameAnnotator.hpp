#ifndef FRAME_ANNOTATOR_HPP
#define FRAME_ANNOTATOR_HPP

#include <opencv2/core.hpp>
#include "FrameTypes.hpp"

// 在帧上绘制检测结果
class FrameAnnotator {
public:
    // 返回绘制后的副本，输入不变
    cv::Mat annotate(const cv::Mat& bgrFrame, const DetectionSet& detections) const;

private:
    cv::Scalar colorFor(const std::string& label) const;
    static int clampTo(float value, int limit);
};

#endif // FRAME_ANNOTATOR_HPP
