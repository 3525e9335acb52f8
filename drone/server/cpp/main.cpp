#include "../hpp/InferenceServer.hpp"
#include "../../infer/hpp/TensorRTDetector.hpp"
#include <iostream>
#include <signal.h>
#include <cstdlib>

// 全局服务器实例
std::unique_ptr<InferenceServer> g_server = nullptr;

// 信号处理函数
void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;

    if (g_server) {
        g_server->stop();
    }
}

int run_inference_server(const ServerConfig& cfg);

int main(int argc, char** argv) {
    // 设置信号处理
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // 默认使用编译期注入的项目根路径拼接配置文件路径，第一个参数可覆盖
    std::string config_path = argc > 1
        ? std::string(argv[1])
        : std::string(PROJECT_ROOT_PATH) + "/config/server_config.json";

    ServerConfig cfg;
    if (!load_server_config(config_path, cfg)) {
        return 1;
    }

    return run_inference_server(cfg);
}

int run_inference_server(const ServerConfig& cfg) {
    // 参数校验
    std::string reason;
    if (!validate_server_config(cfg, &reason)) {
        std::cerr << "Error: " << reason << std::endl;
        return 1;
    }

    trantor::Logger::setLogLevel(parse_log_level(cfg.log_level));

    // 打印配置信息
    std::cout << "=== Drone Vision Server Configuration ===" << std::endl;
    std::cout << "Model path: " << cfg.model_path << std::endl;
    std::cout << "Class names: " << (cfg.class_names_path.empty() ? "(none)" : cfg.class_names_path) << std::endl;
    std::cout << "Server port: " << cfg.port << std::endl;
    std::cout << "GPU device: " << cfg.device_id << std::endl;
    std::cout << "Worker threads: " << cfg.num_threads << std::endl;
    std::cout << "Realtime config: " << config_to_json(cfg.realtime).dump() << std::endl;
    std::cout << "=========================================" << std::endl;

    try {
        auto detector = std::make_unique<TensorRTDetector>(cfg.device_id);
        std::cout << "Loading model..." << std::endl;
        if (!detector->loadModel(cfg.model_path, cfg.class_names_path)) {
            std::cerr << "Failed to load model: " << cfg.model_path << std::endl;
            return 1;
        }

        // 创建推理服务器
        g_server = std::make_unique<InferenceServer>();

        std::cout << "Initializing server..." << std::endl;
        if (!g_server->initialize(cfg, std::move(detector))) {
            std::cerr << "Failed to initialize server" << std::endl;
            return 1;
        }

        std::cout << "Server is running on port " << cfg.port << std::endl;
        std::cout << "Press Ctrl+C to stop the server" << std::endl;

        // 阻塞直到收到退出信号
        if (!g_server->start()) {
            std::cerr << "Failed to start server" << std::endl;
            return 1;
        }
        std::cout << "Final status: " << g_server->get_status() << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    g_server.reset();
    std::cout << "Server stopped" << std::endl;
    return 0;
}
