#include "../hpp/DetrPostprocessor.hpp"
#include "../hpp/TensorPreprocessor.hpp"
#include "../hpp/TensorRTEngine.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

DetrPostprocessor::DetrPostprocessor(std::vector<std::string> classNames)
    : classNames(std::move(classNames)) {
}

std::vector<RawDetection> DetrPostprocessor::postprocess(const EngineOutputs& outputs,
                                                         const TensorInput& input,
                                                         float confidenceThreshold) const {
    std::vector<RawDetection> detections;
    const size_t numQueries = outputs.boxes.size() / 4;
    if (numQueries == 0 || outputs.logits.size() % numQueries != 0) {
        return detections;
    }
    const size_t numClasses = outputs.logits.size() / numQueries;

    for (size_t i = 0; i < numQueries; ++i) {
        auto first = outputs.logits.begin() + static_cast<std::ptrdiff_t>(i * numClasses);
        auto best = std::max_element(first, first + static_cast<std::ptrdiff_t>(numClasses));
        const float confidence = sigmoid(*best);
        if (confidence < confidenceThreshold) {
            continue;
        }
        RawDetection det;
        det.label = labelFor(static_cast<int>(std::distance(first, best)));
        det.confidence = confidence;
        toImageCoordinates(outputs.boxes.data() + i * 4, input, det);
        detections.push_back(std::move(det));
    }
    return detections;
}

std::string DetrPostprocessor::labelFor(int classId) const {
    if (classId >= 0 && classId < static_cast<int>(classNames.size()) && !classNames[classId].empty()) {
        return classNames[classId];
    }
    return "class_" + std::to_string(classId);
}

void DetrPostprocessor::toImageCoordinates(const float* box, const TensorInput& input, RawDetection& out) const {
    const float cx = box[0], cy = box[1], w = box[2], h = box[3];

    // 百分比 -> 输入张量像素；letterbox 只补右/下，除以 scale 即回到原图
    const float invScale = input.scale > 0.0f ? 1.0f / input.scale : 1.0f;
    const float ow = static_cast<float>(input.originalWidth > 0 ? input.originalWidth : input.width);
    const float oh = static_cast<float>(input.originalHeight > 0 ? input.originalHeight : input.height);

    auto clampTo = [](float v, float hi) { return std::max(0.0f, std::min(v, hi)); };
    out.x1 = clampTo((cx - w / 2.0f) * input.width * invScale, ow);
    out.y1 = clampTo((cy - h / 2.0f) * input.height * invScale, oh);
    out.x2 = clampTo((cx + w / 2.0f) * input.width * invScale, ow);
    out.y2 = clampTo((cy + h / 2.0f) * input.height * invScale, oh);
}

float DetrPostprocessor::sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}
