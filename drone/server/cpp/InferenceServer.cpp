#include "../hpp/InferenceServer.hpp"

#include <iostream>
#include <sstream>
#include <drogon/MultiPart.h>
#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>

using json = nlohmann::json;

InferenceServer::InferenceServer()
    : fact_table(AnimalFactTable::builtin()), server_running(false) {
}

InferenceServer::~InferenceServer() {
    stop();
}

bool InferenceServer::initialize(const ServerConfig& config, std::unique_ptr<Detector> model) {
    if (!model) {
        LOG_ERROR << "No detector supplied";
        return false;
    }
    server_config = config;
    detector = std::move(model);
    config_store = std::make_unique<ConfigStore>(config.realtime);
    metrics = std::make_unique<MetricsAggregator>();
    handler = std::make_unique<RequestHandler>(*detector, fact_table, *config_store, *metrics);

    // 配置 Drogon
    drogon::app().setLogLevel(parse_log_level(config.log_level));
    if (!config.log_path.empty()) {
        drogon::app().setLogPath(config.log_path);
    }
    drogon::app().setThreadNum(config.num_threads);
    drogon::app().setClientMaxBodySize(static_cast<size_t>(config.max_body_size_mb) * 1024 * 1024);

    setup_routes();
    if (config.enable_cors) {
        setup_cors();
    }

    LOG_INFO << "Server initialized with model " << detector->modelName()
             << ", " << fact_table.size() << " known animals";
    return true;
}

void InferenceServer::setup_routes() {
    drogon::app().registerHandler("/",
        [this](const drogon::HttpRequestPtr& /*req*/,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(to_response(handler->handle_index()));
        },
        {drogon::Get});

    drogon::app().registerHandler("/predict",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            this->handle_predict_request(req, std::move(callback));
        },
        {drogon::Post});

    drogon::app().registerHandler("/stream",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            this->handle_stream_request(req, std::move(callback));
        },
        {drogon::Post});

    drogon::app().registerHandler("/metrics",
        [this](const drogon::HttpRequestPtr& /*req*/,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(to_response(handler->handle_metrics()));
        },
        {drogon::Get});

    drogon::app().registerHandler("/config",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            if (req->method() == drogon::Post) {
                callback(to_response(handler->handle_update_config(std::string(req->body()))));
            } else {
                callback(to_response(handler->handle_get_config()));
            }
        },
        {drogon::Get, drogon::Post});
}

void InferenceServer::setup_cors() {
    drogon::app().registerPostHandlingAdvice(
        [](const drogon::HttpRequestPtr& /*req*/, const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "*");
        });
}

bool InferenceServer::parse_upload(const drogon::HttpRequestPtr& req,
                                   UploadedFile& file,
                                   std::unordered_map<std::string, std::string>& params) {
    drogon::MultiPartParser parser;
    if (parser.parse(req) != 0) {
        LOG_DEBUG << "Failed to parse multipart/form-data";
        return false;
    }
    params = parser.getParameters();
    for (const auto& part : parser.getFiles()) {
        if (part.getItemName() == "file") {
            auto contentView = part.fileContent();
            file.file_name = part.getFileName();
            file.content.assign(contentView.data(), contentView.size());
            return true;
        }
    }
    return false;
}

void InferenceServer::handle_predict_request(const drogon::HttpRequestPtr& req,
                                             std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    UploadedFile file;
    std::unordered_map<std::string, std::string> params;
    const bool has_file = parse_upload(req, file, params);
    callback(to_response(handler->handle_predict(has_file ? &file : nullptr)));
}

void InferenceServer::handle_stream_request(const drogon::HttpRequestPtr& req,
                                            std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    UploadedFile file;
    std::unordered_map<std::string, std::string> params;
    const bool has_file = parse_upload(req, file, params);

    // frame_idx 优先取表单字段，其次取 query 参数
    std::string frame_idx;
    bool has_frame_idx = false;
    auto it = params.find("frame_idx");
    if (it != params.end()) {
        frame_idx = it->second;
        has_frame_idx = true;
    } else {
        frame_idx = req->getParameter("frame_idx");
        has_frame_idx = !frame_idx.empty();
    }
    callback(to_response(handler->handle_stream(has_file ? &file : nullptr,
                                                has_frame_idx ? &frame_idx : nullptr)));
}

bool InferenceServer::start() {
    if (!handler) {
        LOG_ERROR << "Server not initialized";
        return false;
    }

    std::cout << "Starting HTTP server on port " << server_config.port << std::endl;
    server_running = true;

    // 启动 Drogon 服务器，run() 在 quit() 后返回
    drogon::app().addListener("0.0.0.0", static_cast<uint16_t>(server_config.port));
    drogon::app().run();

    server_running = false;
    return true;
}

void InferenceServer::stop() {
    if (server_running.exchange(false)) {
        drogon::app().quit();
    }
}

bool InferenceServer::is_running() const {
    return server_running;
}

int InferenceServer::get_port() const {
    return server_config.port;
}

std::string InferenceServer::get_status() const {
    std::ostringstream oss;
    oss << "Server running on port " << server_config.port;
    if (metrics) {
        const MetricsSnapshot snap = metrics->snapshot();
        oss << ", Total requests: " << snap.total_requests
            << ", Frames processed: " << snap.total_frames_processed
            << ", Errors: " << snap.error_count;
    }
    return oss.str();
}

drogon::HttpResponsePtr InferenceServer::to_response(const HandlerReply& reply) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(reply.status));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(reply.body.dump(-1, ' ', false, json::error_handler_t::replace));
    return resp;
}
