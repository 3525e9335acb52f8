#ifndef FRAME_TYPES_HPP
#define FRAME_TYPES_HPP

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

// 图像质量指标，全部基于增强前的灰度图计算
struct QualityMetrics {
    double blurScore{0.0};       // Laplacian 响应方差
    double brightnessMean{0.0};
    double brightnessStd{0.0};
    double contrast{0.0};        // 灰度标准差
    double sharpness{0.0};       // Sobel 梯度幅值均值
};

// 检测模型原始输出：标签 + 置信度 + xyxy 像素坐标
struct RawDetection {
    std::string label;
    float confidence{0.0f};
    float x1{0.0f};
    float y1{0.0f};
    float x2{0.0f};
    float y2{0.0f};
};

// 标签对应的描述信息，可选字段只在已知标签上出现
struct AnimalDetails {
    std::string title;
    std::string fact;
    std::string habitat;
    std::string emoji;
    std::optional<std::string> diet;
    std::optional<std::string> lifespan;
    std::optional<std::string> speed;
    std::optional<std::string> weight;
    std::optional<std::string> collectiveNoun;
};

struct Detection {
    std::string label;
    float confidence{0.0f};
    float bbox[4]{0.0f, 0.0f, 0.0f, 0.0f};  // x1, y1, x2, y2
    AnimalDetails details;
};

// 一帧的检测集合，顺序与模型输出一致
struct DetectionSet {
    std::vector<Detection> detections;
    std::optional<size_t> bestIndex;  // 置信度最高者（并列取最先出现的）

    const Detection* bestMatch() const {
        return bestIndex ? &detections[*bestIndex] : nullptr;
    }
    bool empty() const { return detections.empty(); }
    size_t size() const { return detections.size(); }
};

// 预处理产物
struct PreparedFrame {
    cv::Mat modelInput;        // 增强后 RGB，送入检测模型
    cv::Mat enhancedBgr;       // 增强后 BGR，用于绘制标注
    cv::Mat resizedBgr;        // 缩放后、增强前 BGR，用于伪彩色渲染
    std::optional<QualityMetrics> quality;
    std::string resolution;    // "WxH"
    double preprocessTimeMs{0.0};
};

#endif // FRAME_TYPES_HPP
