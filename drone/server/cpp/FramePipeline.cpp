#include "../hpp/FramePipeline.hpp"
#include "../../infer/hpp/ImageUtils.hpp"
#include "../../infer/hpp/VisionErrors.hpp"
#include <chrono>

FramePipeline::FramePipeline(Detector& detector,
                             const AnimalFactTable& facts,
                             ConfigStore& config_store,
                             MetricsAggregator& metrics)
    : detector(detector), config_store(config_store), metrics(metrics),
      thermal_renderer(85), aggregator(facts) {
}

PipelineResult FramePipeline::run(const std::vector<uchar>& raw_bytes, bool render_thermal, int annotate_quality) {
    // 本次请求使用的配置快照
    const RealtimeConfig config = config_store.get();

    FramePreprocessor::Options options;
    options.maxFrameSize = cv::Size(config.max_frame_width, config.max_frame_height);
    options.enableClahe = config.enable_clahe;
    options.enableQuality = config.enable_blur_detection;

    PipelineResult result;
    result.frame = preprocessor.prepare(raw_bytes, options);

    // 伪彩色渲染属于预处理阶段，耗时并入 preprocessTimeMs
    if (render_thermal) {
        auto thermal_start = std::chrono::steady_clock::now();
        result.thermal = thermal_renderer.render(result.frame.resizedBgr, config.enable_thermal);
        result.thermal_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - thermal_start).count();
        result.frame.preprocessTimeMs += result.thermal_time_ms;
    }

    auto infer_start = std::chrono::steady_clock::now();
    std::vector<RawDetection> raw = detector.detect(result.frame.modelInput, static_cast<float>(config.conf_threshold));
    result.inference_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - infer_start).count();

    result.detections = aggregator.build(raw);

    cv::Mat annotated = annotator.annotate(result.frame.enhancedBgr, result.detections);
    result.annotated_jpeg = visionUtils::encode_jpeg(annotated, annotate_quality);

    metrics.record(result.frame.preprocessTimeMs, result.inference_time_ms);
    return result;
}
