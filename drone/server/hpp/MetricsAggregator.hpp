#ifndef METRICS_AGGREGATOR_HPP
#define METRICS_AGGREGATOR_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

// 某一时刻的性能统计快照
struct MetricsSnapshot {
    double uptime_seconds = 0.0;
    std::chrono::system_clock::time_point start_time;
    uint64_t total_requests = 0;
    uint64_t total_frames_processed = 0;
    uint64_t error_count = 0;
    double total_processing_time_ms = 0.0;
    double average_preprocessing_time_ms = 0.0;
    double average_inference_time_ms = 0.0;
    // 滑动窗口 FPS 统计
    double average_fps = 0.0;
    double min_fps = 0.0;
    double max_fps = 0.0;
    size_t fps_samples = 0;
};

// 线程安全的累计 + 滑动窗口性能统计，所有写入和快照共用一把锁
class MetricsAggregator {
public:
    static constexpr size_t kFpsWindowCapacity = 100;

    MetricsAggregator();

    // 记录一次处理耗时（毫秒）
    void record(double preprocessing_ms, double inference_ms, uint64_t frame_delta = 1);

    void increment_request();
    void increment_error();

    MetricsSnapshot snapshot() const;

    // 当前窗口内容（从旧到新）
    std::vector<double> fps_window() const;

private:
    mutable std::mutex metrics_mutex;

    uint64_t total_requests;
    uint64_t total_frames_processed;
    uint64_t error_count;
    uint64_t recorded_samples;
    double total_processing_time_ms;
    double total_preprocessing_ms;
    double total_inference_ms;
    std::deque<double> fps_history;

    std::chrono::steady_clock::time_point start_steady;
    std::chrono::system_clock::time_point start_wall;
};

#endif // METRICS_AGGREGATOR_HPP
