#ifndef VISION_ERRORS_HPP
#define VISION_ERRORS_HPP

#include <stdexcept>
#include <string>

// 请求参数错误（缺少文件、帧序号无法解析等）
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

// 上传的字节无法解码为图像
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

// 检测模型执行失败
class ModelInferenceError : public std::runtime_error {
public:
    explicit ModelInferenceError(const std::string& msg) : std::runtime_error(msg) {}
};

// 运行时配置更新非法
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

#endif // VISION_ERRORS_HPP
