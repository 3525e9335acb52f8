#ifndef REQUEST_HANDLER_HPP
#define REQUEST_HANDLER_HPP

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

#include "FramePipeline.hpp"

// 与 HTTP 框架无关的响应
struct HandlerReply {
    int status = 200;
    nlohmann::json body;
};

// multipart 中的上传文件
struct UploadedFile {
    std::string file_name;
    std::string content;
};

// 各接口的业务处理，负责把异常转换为状态码 + JSON 错误体，并维护请求/错误计数
class RequestHandler {
public:
    static constexpr const char* kVersion = "2.0.0-research";
    static constexpr const char* kStatus = "Drone Vision Backend Running";

    RequestHandler(Detector& detector,
                   const AnimalFactTable& facts,
                   ConfigStore& config_store,
                   MetricsAggregator& metrics);

    HandlerReply handle_index() const;
    // file 为空指针表示请求中没有 file 字段
    HandlerReply handle_predict(const UploadedFile* file);
    HandlerReply handle_stream(const UploadedFile* file, const std::string* frame_idx);
    HandlerReply handle_metrics() const;
    HandlerReply handle_get_config() const;
    HandlerReply handle_update_config(const std::string& body);

    static nlohmann::json detection_to_json(const Detection& detection);
    static nlohmann::json quality_to_json(const PreparedFrame& frame, long long frame_index);
    static nlohmann::json create_error_response(const std::string& message);
    static std::string iso_timestamp(std::chrono::system_clock::time_point tp);
    static long long parse_frame_index(const std::string* frame_idx);

private:
    Detector& detector;
    ConfigStore& config_store;
    MetricsAggregator& metrics;
    FramePipeline pipeline;

    HandlerReply fail(int status, const std::string& message, bool count_error);
};

#endif // REQUEST_HANDLER_HPP
