#include <doctest/doctest.h>
#include <atomic>
#include <opencv2/imgcodecs.hpp>
#include "../hpp/RequestHandler.hpp"
#include "../../infer/hpp/VisionErrors.hpp"

using json = nlohmann::json;

namespace {

// 返回固定结果的检测器，记录调用次数和阈值
class FakeDetector : public Detector {
public:
    std::vector<RawDetection> outputs;
    std::atomic<int> calls{0};
    float last_threshold = -1.0f;
    bool fail = false;

    std::vector<RawDetection> detect(const cv::Mat& rgbImage, float confidenceThreshold) override {
        calls++;
        last_threshold = confidenceThreshold;
        if (rgbImage.empty()) {
            throw ModelInferenceError("empty input");
        }
        if (fail) {
            throw ModelInferenceError("engine exploded");
        }
        return outputs;
    }

    std::string modelName() const override { return "fake-detector"; }
};

RawDetection raw(const std::string& label, float conf, float x1, float y1, float x2, float y2) {
    RawDetection r;
    r.label = label;
    r.confidence = conf;
    r.x1 = x1; r.y1 = y1; r.x2 = x2; r.y2 = y2;
    return r;
}

UploadedFile jpeg_file(int width = 96, int height = 64) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 2), static_cast<uchar>(y * 3), 90);
        }
    }
    std::vector<uchar> bytes;
    cv::imencode(".jpg", image, bytes);
    UploadedFile file;
    file.file_name = "frame.jpg";
    file.content.assign(bytes.begin(), bytes.end());
    return file;
}

struct Fixture {
    FakeDetector detector;
    AnimalFactTable facts = AnimalFactTable::builtin();
    ConfigStore config;
    MetricsAggregator metrics;
    RequestHandler handler{detector, facts, config, metrics};

    Fixture() {
        detector.outputs = {raw("dog", 0.6f, 5, 5, 40, 40),
                            raw("zebra", 0.9f, 10, 10, 60, 50),
                            raw("cat", 2.0f, 0, 0, 10, 10)};
    }
};

} // namespace

TEST_CASE("index reports service info") {
    Fixture f;
    HandlerReply reply = f.handler.handle_index();
    CHECK(reply.status == 200);
    CHECK(reply.body["status"] == "Drone Vision Backend Running");
    CHECK(reply.body["version"] == "2.0.0-research");
    CHECK(reply.body["model"] == "fake-detector");
    CHECK(reply.body["performance"]["total_requests"] == 0);
    CHECK(reply.body["config"]["frame_skip_rate"] == 2);
}

TEST_CASE("predict returns detections, metrics and images") {
    Fixture f;
    UploadedFile file = jpeg_file();
    HandlerReply reply = f.handler.handle_predict(&file);
    REQUIRE(reply.status == 200);

    const json& body = reply.body;
    REQUIRE(body["detections"].size() == 2);  // cat 置信度越界被丢弃
    CHECK(body["detections"][0]["label"] == "dog");
    CHECK(body["detections"][1]["bbox"].size() == 4);
    CHECK(body["detections"][1]["bbox"][2].get<double>() == doctest::Approx(60.0));
    CHECK(body["detections"][1]["details"]["collective_noun"] == "A dazzle of zebras");
    CHECK(body["best_match"]["label"] == "zebra");
    CHECK(body["best_match"]["confidence"].get<double>() == doctest::Approx(0.9));

    const json& rm = body["research_metrics"];
    for (const char* key : {"blur_score", "brightness_mean", "brightness_std", "contrast", "sharpness",
                            "resolution", "preprocessing_time_ms", "inference_time_ms",
                            "total_processing_time_ms", "processor", "frame_index"}) {
        CHECK_MESSAGE(rm.contains(key), key);
    }
    CHECK(rm["resolution"] == "96x64");
    CHECK_FALSE(body["thermal_image"].get<std::string>().empty());
    CHECK_FALSE(body["annotated_image"].get<std::string>().empty());
    CHECK(body["timestamp"].get<std::string>().size() == 26);

    CHECK(f.detector.last_threshold == doctest::Approx(0.25f));
    MetricsSnapshot snap = f.metrics.snapshot();
    CHECK(snap.total_requests == 1);
    CHECK(snap.total_frames_processed == 1);
    CHECK(snap.error_count == 0);
}

TEST_CASE("predict is deterministic for the same image") {
    Fixture f;
    UploadedFile file = jpeg_file();
    HandlerReply a = f.handler.handle_predict(&file);
    HandlerReply b = f.handler.handle_predict(&file);
    REQUIRE(a.status == 200);
    REQUIRE(b.status == 200);
    CHECK(a.body["detections"] == b.body["detections"]);
    CHECK(a.body["research_metrics"]["blur_score"] == b.body["research_metrics"]["blur_score"]);
}

TEST_CASE("predict without detections has null best match") {
    Fixture f;
    f.detector.outputs.clear();
    UploadedFile file = jpeg_file();
    HandlerReply reply = f.handler.handle_predict(&file);
    REQUIRE(reply.status == 200);
    CHECK(reply.body["detections"].empty());
    CHECK(reply.body["best_match"].is_null());
}

TEST_CASE("config toggles flow into predict") {
    Fixture f;
    f.handler.handle_update_config(R"({"enable_thermal": false, "enable_blur_detection": false,
                                        "conf_threshold": 0.7, "max_frame_size": [48, 48]})");
    UploadedFile file = jpeg_file();
    HandlerReply reply = f.handler.handle_predict(&file);
    REQUIRE(reply.status == 200);
    CHECK(reply.body["thermal_image"] == "");
    CHECK_FALSE(reply.body["research_metrics"].contains("blur_score"));
    CHECK(reply.body["research_metrics"]["resolution"] == "48x32");
    CHECK(f.detector.last_threshold == doctest::Approx(0.7f));
}

TEST_CASE("missing or empty upload is an input error") {
    Fixture f;
    HandlerReply none = f.handler.handle_predict(nullptr);
    CHECK(none.status == 400);
    CHECK(none.body["error"] == "No file uploaded");

    UploadedFile unnamed = jpeg_file();
    unnamed.file_name.clear();
    HandlerReply empty = f.handler.handle_predict(&unnamed);
    CHECK(empty.status == 400);
    CHECK(empty.body["error"] == "Empty file");

    MetricsSnapshot snap = f.metrics.snapshot();
    CHECK(snap.total_requests == 2);
    CHECK(snap.error_count == 0);
    CHECK(f.detector.calls.load() == 0);
}

TEST_CASE("undecodable bytes count exactly one error") {
    Fixture f;
    UploadedFile file;
    file.file_name = "broken.jpg";
    file.content = "\xFF\xD8\xFF\xE0 definitely not a jpeg";
    HandlerReply reply = f.handler.handle_predict(&file);
    CHECK(reply.status == 400);
    CHECK(reply.body.contains("error"));
    CHECK(f.metrics.snapshot().error_count == 1);

    HandlerReply stream = f.handler.handle_stream(&file, nullptr);
    CHECK(stream.status == 400);
    CHECK(f.metrics.snapshot().error_count == 2);
    CHECK(f.metrics.snapshot().total_frames_processed == 0);
}

TEST_CASE("model failure is a 500") {
    Fixture f;
    f.detector.fail = true;
    UploadedFile file = jpeg_file();
    HandlerReply reply = f.handler.handle_predict(&file);
    CHECK(reply.status == 500);
    CHECK(reply.body["error"].get<std::string>().find("engine exploded") != std::string::npos);
    CHECK(f.metrics.snapshot().error_count == 1);
}

TEST_CASE("stream skips frames by skip rate") {
    Fixture f;
    UploadedFile file = jpeg_file();

    const std::string one = "1";
    HandlerReply skipped = f.handler.handle_stream(&file, &one);
    CHECK(skipped.status == 200);
    CHECK(skipped.body["skipped"] == true);
    CHECK(skipped.body["frame_idx"] == 1);
    CHECK(skipped.body["message"] == "Frame skipped for real-time performance");
    CHECK(f.detector.calls.load() == 0);
    CHECK(f.metrics.snapshot().total_frames_processed == 0);

    const std::string two = "2";
    HandlerReply processed = f.handler.handle_stream(&file, &two);
    REQUIRE(processed.status == 200);
    CHECK_FALSE(processed.body.contains("skipped"));
    CHECK(processed.body["frame_idx"] == 2);
    CHECK(processed.body["metrics"]["frame_index"] == 2);
    CHECK(processed.body["metrics"].contains("fps"));
    CHECK(processed.body["metrics"].contains("inference_time_ms"));
    CHECK_FALSE(processed.body.contains("thermal_image"));
    CHECK(processed.body["best_match"]["label"] == "zebra");
    CHECK(f.detector.calls.load() == 1);

    MetricsSnapshot snap = f.metrics.snapshot();
    CHECK(snap.total_requests == 2);
    CHECK(snap.total_frames_processed == 1);
}

TEST_CASE("stream follows config updates") {
    Fixture f;
    UploadedFile file = jpeg_file();
    f.handler.handle_update_config(R"({"frame_skip_rate": 3})");

    int processed = 0;
    for (int i = 0; i < 6; ++i) {
        const std::string idx = std::to_string(i);
        HandlerReply reply = f.handler.handle_stream(&file, &idx);
        REQUIRE(reply.status == 200);
        if (!reply.body.contains("skipped")) processed++;
    }
    CHECK(processed == 2);
    CHECK(f.metrics.snapshot().total_requests == 6);
}

TEST_CASE("stream frame index handling") {
    Fixture f;
    UploadedFile file = jpeg_file();

    HandlerReply defaulted = f.handler.handle_stream(&file, nullptr);
    CHECK(defaulted.status == 200);
    CHECK(defaulted.body["frame_idx"] == 0);

    const std::string bad = "abc";
    HandlerReply invalid = f.handler.handle_stream(&file, &bad);
    CHECK(invalid.status == 400);

    const std::string partial = "12x";
    CHECK(f.handler.handle_stream(&file, &partial).status == 400);

    HandlerReply missing = f.handler.handle_stream(nullptr, nullptr);
    CHECK(missing.status == 400);
    CHECK(missing.body["error"] == "No frame data");

    CHECK(f.metrics.snapshot().error_count == 0);
    CHECK(RequestHandler::parse_frame_index(nullptr) == 0);
    const std::string big = "9000000000";
    CHECK(RequestHandler::parse_frame_index(&big) == 9000000000LL);
}

TEST_CASE("config endpoints") {
    Fixture f;
    HandlerReply updated = f.handler.handle_update_config(R"({"frame_skip_rate": 3, "mystery": true})");
    REQUIRE(updated.status == 200);
    CHECK(updated.body["status"] == "Configuration updated");
    CHECK(updated.body["config"]["frame_skip_rate"] == 3);

    HandlerReply current = f.handler.handle_get_config();
    CHECK(current.body["frame_skip_rate"] == 3);
    CHECK(current.body["target_fps"] == 15);
    CHECK(current.body["enable_clahe"] == true);
    CHECK_FALSE(current.body.contains("mystery"));

    HandlerReply rejected = f.handler.handle_update_config(R"({"conf_threshold": 4})");
    CHECK(rejected.status == 400);
    CHECK(rejected.body.contains("error"));

    HandlerReply malformed = f.handler.handle_update_config("{not json");
    CHECK(malformed.status == 400);

    CHECK(f.handler.handle_get_config().body["frame_skip_rate"] == 3);
}

TEST_CASE("posted threshold reads back unchanged") {
    Fixture f;
    HandlerReply updated = f.handler.handle_update_config(R"({"conf_threshold": 0.3})");
    REQUIRE(updated.status == 200);
    CHECK(updated.body["config"]["conf_threshold"].get<double>() == 0.3);
    CHECK(f.handler.handle_get_config().body["conf_threshold"].get<double>() == 0.3);

    UploadedFile file = jpeg_file();
    REQUIRE(f.handler.handle_predict(&file).status == 200);
    CHECK(f.detector.last_threshold == 0.3f);
}

TEST_CASE("detection values are serialized without float noise") {
    Fixture f;
    f.detector.outputs = {raw("zebra", 0.7f, 10.3f, 20.7f, 30.1f, 40.9f)};
    UploadedFile file = jpeg_file();
    HandlerReply reply = f.handler.handle_predict(&file);
    REQUIRE(reply.status == 200);
    const json& det = reply.body["detections"][0];
    CHECK(det["confidence"].get<double>() == 0.7);
    CHECK(det["bbox"][0].get<double>() == 10.3);
    CHECK(det["bbox"][3].get<double>() == 40.9);
}

TEST_CASE("metrics endpoint") {
    Fixture f;
    UploadedFile file = jpeg_file();
    f.handler.handle_predict(&file);
    f.handler.handle_predict(nullptr);
    f.detector.fail = true;
    f.handler.handle_predict(&file);

    HandlerReply reply = f.handler.handle_metrics();
    CHECK(reply.status == 200);
    const json& pm = reply.body["processing_metrics"];
    CHECK(pm["total_requests"] == 3);
    CHECK(pm["total_frames_processed"] == 1);
    CHECK(pm["error_count"] == 1);
    CHECK(pm["error_rate"].get<double>() == doctest::Approx(0.3333));
    CHECK(reply.body["performance_metrics"]["fps_samples"].get<int>() <= 1);
    CHECK(reply.body["system_metrics"].contains("start_time"));
    CHECK(reply.body["system_metrics"].contains("uptime_hours"));
    CHECK(reply.body["configuration"]["frame_skip_rate"] == 2);
}

TEST_CASE("timestamp format") {
    std::string ts = RequestHandler::iso_timestamp(std::chrono::system_clock::now());
    REQUIRE(ts.size() == 26);
    CHECK(ts[4] == '-');
    CHECK(ts[10] == 'T');
    CHECK(ts[19] == '.');
}
