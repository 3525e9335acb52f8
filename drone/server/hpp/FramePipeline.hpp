#ifndef FRAME_PIPELINE_HPP
#define FRAME_PIPELINE_HPP

#include <vector>
#include <opencv2/core.hpp>

#include "../../infer/hpp/AnimalFactTable.hpp"
#include "../../infer/hpp/DetectionAggregator.hpp"
#include "../../infer/hpp/Detector.hpp"
#include "../../infer/hpp/FrameAnnotator.hpp"
#include "../../infer/hpp/FramePreprocessor.hpp"
#include "../../infer/hpp/FrameTypes.hpp"
#include "../../infer/hpp/ThermalRenderer.hpp"
#include "ConfigStore.hpp"
#include "MetricsAggregator.hpp"

// 单帧处理结果
struct PipelineResult {
    PreparedFrame frame;
    ThermalFrame thermal;
    DetectionSet detections;
    std::vector<uchar> annotated_jpeg;
    double inference_time_ms = 0.0;
    double thermal_time_ms = 0.0;   // 已计入 frame.preprocessTimeMs
};

// 单帧处理流水线：预处理 -> 伪彩色 -> 检测 -> 汇总 -> 标注 -> 记录耗时
// 整个过程在调用线程内同步执行，仅 MetricsAggregator 和 ConfigStore 为共享状态
class FramePipeline {
public:
    FramePipeline(Detector& detector,
                  const AnimalFactTable& facts,
                  ConfigStore& config_store,
                  MetricsAggregator& metrics);

    // 解码失败抛 DecodeError，模型失败抛 ModelInferenceError
    PipelineResult run(const std::vector<uchar>& raw_bytes, bool render_thermal, int annotate_quality);

private:
    Detector& detector;
    ConfigStore& config_store;
    MetricsAggregator& metrics;

    FramePreprocessor preprocessor;
    ThermalRenderer thermal_renderer;
    DetectionAggregator aggregator;
    FrameAnnotator annotator;
};

#endif // FRAME_PIPELINE_HPP
