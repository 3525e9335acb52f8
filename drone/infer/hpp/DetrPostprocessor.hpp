#ifndef DETR_POSTPROCESSOR_HPP
#define DETR_POSTPROCESSOR_HPP

#include <string>
#include <utility>
#include <vector>
#include "FrameTypes.hpp"

struct EngineOutputs;
struct TensorInput;

// 解析 DETR 类模型输出：每个 query 取最高类别分数，sigmoid 后过阈值
class DetrPostprocessor {
public:
    explicit DetrPostprocessor(std::vector<std::string> classNames = {});

    void setClassNames(std::vector<std::string> names) { classNames = std::move(names); }
    const std::vector<std::string>& getClassNames() const { return classNames; }

    std::vector<RawDetection> postprocess(const EngineOutputs& outputs,
                                          const TensorInput& input,
                                          float confidenceThreshold) const;

    std::string labelFor(int classId) const;

private:
    std::vector<std::string> classNames;

    // 归一化 cxcywh -> 原图像素 xyxy，并裁剪到图像范围
    void toImageCoordinates(const float* box, const TensorInput& input, RawDetection& out) const;

    static float sigmoid(float x);
};

#endif // DETR_POSTPROCESSOR_HPP
