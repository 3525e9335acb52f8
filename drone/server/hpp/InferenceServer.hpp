#ifndef INFERENCE_SERVER_HPP
#define INFERENCE_SERVER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <unordered_map>
#include <string>
#include <drogon/drogon.h>

#include "../../infer/hpp/AnimalFactTable.hpp"
#include "../../infer/hpp/Detector.hpp"
#include "ConfigStore.hpp"
#include "MetricsAggregator.hpp"
#include "RequestHandler.hpp"
#include "ServerConfig.hpp"

// 推理服务器类 - 把 RequestHandler 绑定到 drogon 路由
class InferenceServer {
public:
    InferenceServer();
    ~InferenceServer();

    // 初始化服务器，detector 需已加载模型
    bool initialize(const ServerConfig& config, std::unique_ptr<Detector> detector);

    // 启动服务器（阻塞直到 stop）
    bool start();

    // 停止服务器
    void stop();

    bool is_running() const;
    int get_port() const;
    std::string get_status() const;

    static drogon::HttpResponsePtr to_response(const HandlerReply& reply);

private:
    void setup_routes();
    void setup_cors();

    void handle_predict_request(const drogon::HttpRequestPtr& req,
                                std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void handle_stream_request(const drogon::HttpRequestPtr& req,
                               std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    // 解析 multipart 表单，取出 file 字段和其余表单参数
    static bool parse_upload(const drogon::HttpRequestPtr& req,
                             UploadedFile& file,
                             std::unordered_map<std::string, std::string>& params);

    ServerConfig server_config;

    std::unique_ptr<Detector> detector;
    AnimalFactTable fact_table;
    std::unique_ptr<ConfigStore> config_store;
    std::unique_ptr<MetricsAggregator> metrics;
    std::unique_ptr<RequestHandler> handler;

    std::atomic<bool> server_running;
};

#endif // INFERENCE_SERVER_HPP
