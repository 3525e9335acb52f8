#include "../hpp/MetricsAggregator.hpp"
#include <algorithm>

MetricsAggregator::MetricsAggregator()
    : total_requests(0), total_frames_processed(0), error_count(0), recorded_samples(0),
      total_processing_time_ms(0.0), total_preprocessing_ms(0.0), total_inference_ms(0.0),
      start_steady(std::chrono::steady_clock::now()),
      start_wall(std::chrono::system_clock::now()) {
}

void MetricsAggregator::record(double preprocessing_ms, double inference_ms, uint64_t frame_delta) {
    preprocessing_ms = std::max(0.0, preprocessing_ms);
    inference_ms = std::max(0.0, inference_ms);
    const double total_ms = preprocessing_ms + inference_ms;

    std::lock_guard<std::mutex> lock(metrics_mutex);
    total_frames_processed += frame_delta;
    total_processing_time_ms += total_ms;
    total_preprocessing_ms += preprocessing_ms;
    total_inference_ms += inference_ms;
    ++recorded_samples;

    // 两段耗时都为 0 时 FPS 无定义，不进入窗口
    if (total_ms > 0.0) {
        fps_history.push_back(1000.0 / total_ms);
        if (fps_history.size() > kFpsWindowCapacity) {
            fps_history.pop_front();
        }
    }
}

void MetricsAggregator::increment_request() {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    ++total_requests;
}

void MetricsAggregator::increment_error() {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    ++error_count;
}

MetricsSnapshot MetricsAggregator::snapshot() const {
    MetricsSnapshot snap;
    std::lock_guard<std::mutex> lock(metrics_mutex);

    snap.uptime_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_steady).count();
    snap.start_time = start_wall;
    snap.total_requests = total_requests;
    snap.total_frames_processed = total_frames_processed;
    snap.error_count = error_count;
    snap.total_processing_time_ms = total_processing_time_ms;
    if (recorded_samples > 0) {
        snap.average_preprocessing_time_ms = total_preprocessing_ms / recorded_samples;
        snap.average_inference_time_ms = total_inference_ms / recorded_samples;
    }

    snap.fps_samples = fps_history.size();
    if (!fps_history.empty()) {
        double sum = 0.0;
        snap.min_fps = fps_history.front();
        snap.max_fps = fps_history.front();
        for (double fps : fps_history) {
            sum += fps;
            snap.min_fps = std::min(snap.min_fps, fps);
            snap.max_fps = std::max(snap.max_fps, fps);
        }
        snap.average_fps = sum / fps_history.size();
    }
    return snap;
}

std::vector<double> MetricsAggregator::fps_window() const {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    return std::vector<double>(fps_history.begin(), fps_history.end());
}
