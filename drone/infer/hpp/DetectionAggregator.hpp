#ifndef DETECTION_AGGREGATOR_HPP
#define DETECTION_AGGREGATOR_HPP

#include <string>
#include <vector>
#include "AnimalFactTable.hpp"
#include "FrameTypes.hpp"

// 检测结果汇总 - 校验模型输出、补充描述信息、选出最佳匹配
class DetectionAggregator {
public:
    explicit DetectionAggregator(const AnimalFactTable& facts);

    DetectionSet build(const std::vector<RawDetection>& rawOutputs) const;

    // 置信度在 [0,1]、坐标有限且 x2>=x1, y2>=y1、标签非空
    static bool isValid(const RawDetection& raw, std::string* reason = nullptr);

private:
    const AnimalFactTable& facts;

    Detection enrich(const RawDetection& raw) const;
};

#endif // DETECTION_AGGREGATOR_HPP
