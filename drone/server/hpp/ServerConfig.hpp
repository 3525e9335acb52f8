#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <string>
#include <trantor/utils/Logger.h>
#include "ConfigStore.hpp"

// 服务器配置结构
struct ServerConfig {
    std::string model_path;
    std::string class_names_path;    // 相对路径以配置文件所在目录为基准
    int device_id = 0;
    int port = 5000;
    int num_threads = 4;
    int max_body_size_mb = 50;
    bool enable_cors = true;
    std::string log_level = "info";
    std::string log_path;            // 为空时输出到终端
    RealtimeConfig realtime;         // 运行时参数初始值
};

// 从 JSON 文件读取配置，失败时打印原因并返回 false
bool load_server_config(const std::string& path, ServerConfig& out);

// 校验端口、线程数等取值
bool validate_server_config(const ServerConfig& config, std::string* reason = nullptr);

// "trace" / "debug" / "info" / "warn" / "error"，未知值按 info 处理
trantor::Logger::LogLevel parse_log_level(const std::string& level);

#endif // SERVER_CONFIG_HPP
