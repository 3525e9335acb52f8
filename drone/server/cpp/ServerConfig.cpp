#include "../hpp/ServerConfig.hpp"
#include "../../infer/hpp/VisionErrors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

bool load_server_config(const std::string& path, ServerConfig& out) {
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            std::cerr << "Error: cannot open config file: " << path << std::endl;
            return false;
        }
        nlohmann::json j;
        ifs >> j;
        if (!j.contains("model_path")) {
            std::cerr << "Error: config missing required field: model_path" << std::endl;
            return false;
        }
        out.model_path = j.at("model_path").get<std::string>();
        if (j.contains("class_names_path")) {
            // 相对路径以配置文件所在目录为基准
            std::filesystem::path names(j.at("class_names_path").get<std::string>());
            if (!names.empty() && names.is_relative()) {
                names = std::filesystem::path(path).parent_path() / names;
            }
            out.class_names_path = names.string();
        }
        if (j.contains("device_id")) out.device_id = j.at("device_id").get<int>();
        if (j.contains("port")) out.port = j.at("port").get<int>();
        if (j.contains("threads")) out.num_threads = j.at("threads").get<int>();
        if (j.contains("max_body_size_mb")) out.max_body_size_mb = j.at("max_body_size_mb").get<int>();
        if (j.contains("enable_cors")) out.enable_cors = j.at("enable_cors").get<bool>();
        if (j.contains("log_level")) out.log_level = j.at("log_level").get<std::string>();
        if (j.contains("log_path")) out.log_path = j.at("log_path").get<std::string>();
        if (j.contains("realtime")) {
            out.realtime = ConfigStore::apply(out.realtime, j.at("realtime"));
        }
        return true;
    } catch (const ConfigError& e) {
        std::cerr << "Error: invalid realtime section: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config file: " << e.what() << std::endl;
        return false;
    }
}

bool validate_server_config(const ServerConfig& config, std::string* reason) {
    auto reject = [reason](const std::string& msg) {
        if (reason) *reason = msg;
        return false;
    };
    if (config.port <= 0 || config.port > 65535) {
        return reject("Invalid port number: " + std::to_string(config.port));
    }
    if (config.device_id < 0) {
        return reject("Invalid device ID: " + std::to_string(config.device_id));
    }
    if (config.num_threads <= 0 || config.num_threads > 32) {
        return reject("Invalid number of threads: " + std::to_string(config.num_threads));
    }
    if (config.max_body_size_mb <= 0) {
        return reject("Invalid max body size: " + std::to_string(config.max_body_size_mb));
    }
    return true;
}

trantor::Logger::LogLevel parse_log_level(const std::string& level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return trantor::Logger::kTrace;
    if (lower == "debug") return trantor::Logger::kDebug;
    if (lower == "warn" || lower == "warning") return trantor::Logger::kWarn;
    if (lower == "error") return trantor::Logger::kError;
    return trantor::Logger::kInfo;
}
