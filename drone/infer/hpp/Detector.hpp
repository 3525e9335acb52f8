#ifndef DETECTOR_HPP
#define DETECTOR_HPP

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FrameTypes.hpp"

// 检测模型抽象接口
// 输入为预处理后的 RGB 图像，输出框坐标基于该图像像素；失败抛 ModelInferenceError
class Detector {
public:
    virtual ~Detector() = default;

    virtual std::vector<RawDetection> detect(const cv::Mat& rgbImage, float confidenceThreshold) = 0;

    virtual std::string modelName() const = 0;
};

#endif // DETECTOR_HPP
