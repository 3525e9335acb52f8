#ifndef TRT_LOGGER_HPP
#define TRT_LOGGER_HPP

#include <NvInfer.h>

// TensorRT 日志桥接到 trantor Logger
class TrtLogger : public nvinfer1::ILogger {
public:
    void log(Severity severity, const char* msg) noexcept override;
    static TrtLogger& getInstance();
private:
    TrtLogger() = default;
};

#endif // TRT_LOGGER_HPP
