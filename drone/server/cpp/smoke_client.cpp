#include <iostream>
#include <curl/curl.h>
#include <json/json.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// 回调函数：接收 HTTP 响应数据
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

struct HttpResult {
    bool ok = false;
    long status = 0;
    std::string body;
};

static bool parse_json(const std::string& text, Json::Value& root) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        std::cerr << "Failed to parse JSON response: " << errors << std::endl;
        return false;
    }
    return true;
}

static HttpResult perform(const std::string& url,
                          const std::string* post_body = nullptr,
                          const std::string& content_type = "") {
    HttpResult result;
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "Failed to initialize CURL" << std::endl;
        return result;
    }

    struct curl_slist* headers = nullptr;
    if (!content_type.empty()) {
        headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (post_body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
        result.ok = true;
    } else {
        std::cerr << "CURL request failed: " << curl_easy_strerror(res) << std::endl;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

// 构建 multipart 请求体：file 字段 + 可选 frame_idx 字段
static std::string build_multipart(const std::string& boundary,
                                   const std::string& file_name,
                                   const std::vector<char>& image_data,
                                   const std::string* frame_idx) {
    std::string request_data;
    request_data += "--" + boundary + "\r\n";
    request_data += "Content-Disposition: form-data; name=\"file\"; filename=\"" + file_name + "\"\r\n";
    request_data += "Content-Type: image/jpeg\r\n\r\n";
    request_data.append(image_data.begin(), image_data.end());
    request_data += "\r\n";

    if (frame_idx) {
        request_data += "--" + boundary + "\r\n";
        request_data += "Content-Disposition: form-data; name=\"frame_idx\"\r\n\r\n";
        request_data += *frame_idx + "\r\n";
    }
    request_data += "--" + boundary + "--\r\n";
    return request_data;
}

static bool read_file(const std::string& path, std::vector<char>& data) {
    std::ifstream image_file(path, std::ios::binary);
    if (!image_file.is_open()) {
        std::cerr << "Failed to open image file: " << path << std::endl;
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(image_file), std::istreambuf_iterator<char>());
    return true;
}

static void print_detections(const Json::Value& root) {
    const Json::Value& detections = root["detections"];
    std::cout << "Detections found: " << detections.size() << std::endl;
    for (const auto& det : detections) {
        const Json::Value& box = det["bbox"];
        std::cout << "  - " << det["label"].asString()
                  << ", Confidence: " << det["confidence"].asFloat()
                  << ", Box: (" << box[0].asFloat() << "," << box[1].asFloat()
                  << "," << box[2].asFloat() << "," << box[3].asFloat() << ")"
                  << " " << det["details"]["emoji"].asString() << " " << det["details"]["title"].asString()
                  << std::endl;
    }
    if (!root["best_match"].isNull()) {
        std::cout << "Best match: " << root["best_match"]["label"].asString() << std::endl;
    }
}

// 测试 GET 接口
bool test_get(const std::string& server_url, const std::string& path) {
    HttpResult res = perform(server_url + path);
    if (!res.ok) {
        return false;
    }
    std::cout << "GET " << path << " -> " << res.status << ": " << res.body << std::endl;
    return res.status == 200;
}

// 发送单张推理请求
bool test_predict(const std::string& server_url, const std::string& image_path) {
    std::vector<char> image_data;
    if (!read_file(image_path, image_data)) {
        return false;
    }
    const std::string boundary = "----DroneVisionBoundary7MA4YWxkTrZu0gW";
    const std::string body = build_multipart(boundary,
        std::filesystem::path(image_path).filename().string(), image_data, nullptr);

    HttpResult res = perform(server_url + "/predict", &body, "multipart/form-data; boundary=" + boundary);
    if (!res.ok) {
        return false;
    }
    std::cout << "Response received: " << res.body.length() << " bytes, status " << res.status << std::endl;

    Json::Value root;
    if (!parse_json(res.body, root)) {
        return false;
    }
    if (res.status != 200) {
        std::cerr << "Prediction failed: " << root["error"].asString() << std::endl;
        return false;
    }
    const Json::Value& rm = root["research_metrics"];
    std::cout << "Resolution: " << rm["resolution"].asString()
              << ", preprocessing: " << rm["preprocessing_time_ms"].asDouble() << " ms"
              << ", inference: " << rm["inference_time_ms"].asDouble() << " ms"
              << ", blur score: " << rm["blur_score"].asDouble() << std::endl;
    std::cout << "Thermal image: " << root["thermal_image"].asString().size() << " base64 chars" << std::endl;
    print_detections(root);
    return true;
}

// 按帧序号连续发送，统计跳帧数量
bool test_stream(const std::string& server_url, const std::string& image_path, int frames) {
    std::vector<char> image_data;
    if (!read_file(image_path, image_data)) {
        return false;
    }
    const std::string boundary = "----DroneVisionBoundary7MA4YWxkTrZu0gW";
    int skipped = 0;
    int processed = 0;
    for (int i = 0; i < frames; ++i) {
        const std::string frame_idx = std::to_string(i);
        const std::string body = build_multipart(boundary, "frame.jpg", image_data, &frame_idx);
        HttpResult res = perform(server_url + "/stream", &body, "multipart/form-data; boundary=" + boundary);
        if (!res.ok) {
            return false;
        }
        Json::Value root;
        if (!parse_json(res.body, root)) {
            return false;
        }
        if (res.status != 200) {
            std::cerr << "Frame " << i << " failed: " << root["error"].asString() << std::endl;
            return false;
        }
        if (root.get("skipped", false).asBool()) {
            skipped++;
        } else {
            processed++;
            std::cout << "Frame " << i << ": " << root["detections"].size() << " detections, fps "
                      << root["metrics"]["fps"].asDouble() << std::endl;
        }
    }
    std::cout << "Stream: " << processed << " processed, " << skipped << " skipped" << std::endl;
    return true;
}

bool test_update_config(const std::string& server_url, const std::string& body) {
    HttpResult res = perform(server_url + "/config", &body, "application/json");
    if (!res.ok) {
        return false;
    }
    std::cout << "POST /config " << body << " -> " << res.status << ": " << res.body << std::endl;
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <server_url> <image_path> [stream_frames]" << std::endl;
        std::cout << "Example: " << argv[0] << " http://localhost:5000 zebra.jpg 10" << std::endl;
        return 1;
    }

    std::string server_url = argv[1];
    std::string image_path = argv[2];
    int stream_frames = 10;
    if (argc > 3) {
        try {
            stream_frames = std::stoi(argv[3]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid frame count: " << argv[3] << " (" << e.what() << ")" << std::endl;
            return 1;
        }
    }

    std::cout << "=== Drone Vision Smoke Test ===" << std::endl;
    std::cout << "Server URL: " << server_url << std::endl;
    std::cout << "Image path: " << image_path << std::endl;
    std::cout << "===============================" << std::endl;

    curl_global_init(CURL_GLOBAL_ALL);

    int failures = 0;
    std::cout << "\n1. Testing index..." << std::endl;
    if (!test_get(server_url, "/")) failures++;

    std::cout << "\n2. Testing config..." << std::endl;
    if (!test_get(server_url, "/config")) failures++;
    if (!test_update_config(server_url, "{\"frame_skip_rate\": 3}")) failures++;
    if (!test_update_config(server_url, "{\"conf_threshold\": 7}")) failures++;

    std::cout << "\n3. Testing prediction..." << std::endl;
    if (!test_predict(server_url, image_path)) failures++;

    std::cout << "\n4. Testing stream..." << std::endl;
    if (!test_stream(server_url, image_path, stream_frames)) failures++;

    std::cout << "\n5. Testing metrics..." << std::endl;
    if (!test_get(server_url, "/metrics")) failures++;

    curl_global_cleanup();

    std::cout << "\nTest completed with " << failures << " failure(s)" << std::endl;
    return failures == 0 ? 0 : 1;
}
