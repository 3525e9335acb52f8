#include "../hpp/RequestHandler.hpp"
#include "../../infer/hpp/ImageUtils.hpp"
#include "../../infer/hpp/SkipPolicy.hpp"
#include "../../infer/hpp/VisionErrors.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <drogon/utils/Utilities.h>
#include <trantor/utils/Logger.h>

using json = nlohmann::json;
using visionUtils::round_to;

namespace {

std::string to_base64(const std::vector<uchar>& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    return drogon::utils::base64Encode(bytes.data(), bytes.size());
}

std::vector<uchar> to_bytes(const std::string& content) {
    return std::vector<uchar>(content.begin(), content.end());
}

} // namespace

RequestHandler::RequestHandler(Detector& detector,
                               const AnimalFactTable& facts,
                               ConfigStore& config_store,
                               MetricsAggregator& metrics)
    : detector(detector), config_store(config_store), metrics(metrics),
      pipeline(detector, facts, config_store, metrics) {
}

HandlerReply RequestHandler::handle_index() const {
    const MetricsSnapshot snap = metrics.snapshot();
    HandlerReply reply;
    reply.body["status"] = kStatus;
    reply.body["version"] = kVersion;
    reply.body["model"] = detector.modelName();
    reply.body["uptime_seconds"] = round_to(snap.uptime_seconds, 2);
    reply.body["performance"] = {
        {"total_requests", snap.total_requests},
        {"total_frames_processed", snap.total_frames_processed},
        {"average_fps", round_to(snap.average_fps, 2)},
        {"average_inference_time_ms", round_to(snap.average_inference_time_ms, 2)},
        {"error_count", snap.error_count}
    };
    reply.body["config"] = config_to_json(config_store.get());
    return reply;
}

HandlerReply RequestHandler::handle_predict(const UploadedFile* file) {
    auto start_request = std::chrono::steady_clock::now();
    metrics.increment_request();

    try {
        if (file == nullptr) {
            throw InputError("No file uploaded");
        }
        if (file->file_name.empty()) {
            throw InputError("Empty file");
        }

        PipelineResult result = pipeline.run(to_bytes(file->content), true, 85);

        const double total_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_request).count();

        json detections = json::array();
        for (const auto& det : result.detections.detections) {
            detections.push_back(detection_to_json(det));
        }
        json research_metrics = quality_to_json(result.frame, 0);
        research_metrics["inference_time_ms"] = round_to(result.inference_time_ms, 2);
        research_metrics["total_processing_time_ms"] = round_to(total_ms, 2);

        HandlerReply reply;
        reply.body["detections"] = detections;
        reply.body["best_match"] = result.detections.bestMatch()
            ? detection_to_json(*result.detections.bestMatch()) : json(nullptr);
        reply.body["research_metrics"] = research_metrics;
        reply.body["thermal_image"] = to_base64(result.thermal.jpeg);
        reply.body["annotated_image"] = to_base64(result.annotated_jpeg);
        reply.body["timestamp"] = iso_timestamp(std::chrono::system_clock::now());

        char timing[160];
        std::snprintf(timing, sizeof(timing),
                      "Request processed in %.2fms (preprocessing: %.2fms, inference: %.2fms), detections: %zu",
                      total_ms, result.frame.preprocessTimeMs, result.inference_time_ms,
                      result.detections.size());
        LOG_INFO << timing;
        return reply;

    } catch (const InputError& e) {
        return fail(400, e.what(), false);
    } catch (const DecodeError& e) {
        LOG_ERROR << "Preprocessing error: " << e.what();
        return fail(400, std::string("Image processing failed: ") + e.what(), true);
    } catch (const ModelInferenceError& e) {
        LOG_ERROR << "Prediction error (model): " << e.what();
        return fail(500, std::string("Model inference failed: ") + e.what(), true);
    } catch (const std::exception& e) {
        LOG_ERROR << "Prediction error: " << e.what();
        return fail(500, std::string("Internal server error: ") + e.what(), true);
    }
}

HandlerReply RequestHandler::handle_stream(const UploadedFile* file, const std::string* frame_idx) {
    metrics.increment_request();

    try {
        if (file == nullptr) {
            throw InputError("No frame data");
        }
        const long long frame_index = parse_frame_index(frame_idx);

        // 跳帧直接返回，不做预处理、推理和耗时记录
        const int skip_rate = config_store.get().frame_skip_rate;
        if (!SkipPolicy::shouldProcess(frame_index, skip_rate)) {
            HandlerReply reply;
            reply.body["skipped"] = true;
            reply.body["frame_idx"] = frame_index;
            reply.body["message"] = "Frame skipped for real-time performance";
            return reply;
        }

        PipelineResult result = pipeline.run(to_bytes(file->content), false, 75);

        json detections = json::array();
        for (const auto& det : result.detections.detections) {
            detections.push_back(detection_to_json(det));
        }
        json frame_metrics = quality_to_json(result.frame, frame_index);
        frame_metrics["inference_time_ms"] = round_to(result.inference_time_ms, 2);
        const double total_ms = result.frame.preprocessTimeMs + result.inference_time_ms;
        frame_metrics["fps"] = total_ms > 0.0 ? json(round_to(1000.0 / total_ms, 2)) : json(nullptr);

        HandlerReply reply;
        reply.body["detections"] = detections;
        reply.body["best_match"] = result.detections.bestMatch()
            ? detection_to_json(*result.detections.bestMatch()) : json(nullptr);
        reply.body["annotated_image"] = to_base64(result.annotated_jpeg);
        reply.body["frame_idx"] = frame_index;
        reply.body["metrics"] = frame_metrics;
        reply.body["timestamp"] = iso_timestamp(std::chrono::system_clock::now());

        LOG_DEBUG << "Stream frame " << frame_index << ": " << result.detections.size() << " detections";
        return reply;

    } catch (const InputError& e) {
        return fail(400, e.what(), false);
    } catch (const DecodeError& e) {
        LOG_ERROR << "Stream decode error: " << e.what();
        return fail(400, std::string("Invalid frame data: ") + e.what(), true);
    } catch (const ModelInferenceError& e) {
        LOG_ERROR << "Stream processing error (model): " << e.what();
        return fail(500, std::string("Model inference failed: ") + e.what(), true);
    } catch (const std::exception& e) {
        LOG_ERROR << "Stream processing error: " << e.what();
        return fail(500, std::string("Stream processing failed: ") + e.what(), true);
    }
}

HandlerReply RequestHandler::handle_metrics() const {
    const MetricsSnapshot snap = metrics.snapshot();
    const auto now = std::chrono::system_clock::now();
    const double error_rate = static_cast<double>(snap.error_count) /
                              static_cast<double>(std::max<uint64_t>(snap.total_requests, 1));

    HandlerReply reply;
    reply.body["system_metrics"] = {
        {"uptime_seconds", round_to(snap.uptime_seconds, 2)},
        {"uptime_hours", round_to(snap.uptime_seconds / 3600.0, 2)},
        {"start_time", iso_timestamp(snap.start_time)},
        {"current_time", iso_timestamp(now)}
    };
    reply.body["processing_metrics"] = {
        {"total_requests", snap.total_requests},
        {"total_frames_processed", snap.total_frames_processed},
        {"average_inference_time_ms", round_to(snap.average_inference_time_ms, 2)},
        {"average_preprocessing_time_ms", round_to(snap.average_preprocessing_time_ms, 2)},
        {"error_count", snap.error_count},
        {"error_rate", round_to(error_rate, 4)}
    };
    reply.body["performance_metrics"] = {
        {"average_fps", round_to(snap.average_fps, 2)},
        {"min_fps", round_to(snap.min_fps, 2)},
        {"max_fps", round_to(snap.max_fps, 2)},
        {"fps_samples", snap.fps_samples}
    };
    reply.body["configuration"] = config_to_json(config_store.get());
    return reply;
}

HandlerReply RequestHandler::handle_get_config() const {
    HandlerReply reply;
    reply.body = config_to_json(config_store.get());
    return reply;
}

HandlerReply RequestHandler::handle_update_config(const std::string& body) {
    HandlerReply reply;
    try {
        json partial = json::parse(body);
        RealtimeConfig updated = config_store.update(partial);
        reply.body["status"] = "Configuration updated";
        reply.body["config"] = config_to_json(updated);
    } catch (const json::parse_error& e) {
        reply.status = 400;
        reply.body = create_error_response(std::string("Invalid JSON body: ") + e.what());
    } catch (const ConfigError& e) {
        LOG_WARN << "Rejected config update: " << e.what();
        reply.status = 400;
        reply.body = create_error_response(e.what());
    }
    return reply;
}

json RequestHandler::detection_to_json(const Detection& detection) {
    json details;
    details["title"] = detection.details.title;
    details["fact"] = detection.details.fact;
    details["habitat"] = detection.details.habitat;
    details["emoji"] = detection.details.emoji;
    if (detection.details.diet) details["diet"] = *detection.details.diet;
    if (detection.details.lifespan) details["lifespan"] = *detection.details.lifespan;
    if (detection.details.speed) details["speed"] = *detection.details.speed;
    if (detection.details.weight) details["weight"] = *detection.details.weight;
    if (detection.details.collectiveNoun) details["collective_noun"] = *detection.details.collectiveNoun;

    json j;
    j["label"] = detection.label;
    // float 直接转 double 会带出尾数噪声
    j["confidence"] = round_to(static_cast<double>(detection.confidence), 4);
    json bbox = json::array();
    for (float v : detection.bbox) {
        bbox.push_back(round_to(static_cast<double>(v), 2));
    }
    j["bbox"] = bbox;
    j["details"] = details;
    return j;
}

json RequestHandler::quality_to_json(const PreparedFrame& frame, long long frame_index) {
    json j = json::object();
    if (frame.quality) {
        j["blur_score"] = round_to(frame.quality->blurScore, 2);
        j["brightness_mean"] = round_to(frame.quality->brightnessMean, 2);
        j["brightness_std"] = round_to(frame.quality->brightnessStd, 2);
        j["contrast"] = round_to(frame.quality->contrast, 2);
        j["sharpness"] = round_to(frame.quality->sharpness, 2);
    }
    j["resolution"] = frame.resolution;
    j["preprocessing_time_ms"] = round_to(frame.preprocessTimeMs, 2);
    j["processor"] = "OpenCV";
    j["frame_index"] = frame_index;
    return j;
}

json RequestHandler::create_error_response(const std::string& message) {
    json response;
    response["error"] = message;
    return response;
}

std::string RequestHandler::iso_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lld", date, static_cast<long long>(micros < 0 ? micros + 1000000 : micros));
    return out;
}

// 缺省为 0；无法解析抛 InputError
long long RequestHandler::parse_frame_index(const std::string* frame_idx) {
    if (frame_idx == nullptr || frame_idx->empty()) {
        return 0;
    }
    try {
        size_t consumed = 0;
        const long long value = std::stoll(*frame_idx, &consumed);
        if (consumed != frame_idx->size()) {
            throw InputError("Invalid frame_idx: " + *frame_idx);
        }
        return value;
    } catch (const std::logic_error&) {
        throw InputError("Invalid frame_idx: " + *frame_idx);
    }
}

HandlerReply RequestHandler::fail(int status, const std::string& message, bool count_error) {
    if (count_error) {
        metrics.increment_error();
    }
    HandlerReply reply;
    reply.status = status;
    reply.body = create_error_response(message);
    return reply;
}
