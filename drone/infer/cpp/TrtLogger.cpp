#include "../hpp/TrtLogger.hpp"
#include <trantor/utils/Logger.h>

void TrtLogger::log(Severity severity, const char* msg) noexcept {
    switch (severity) {
        case Severity::kINTERNAL_ERROR:
        case Severity::kERROR:
            LOG_ERROR << "[TensorRT] " << msg;
            break;
        case Severity::kWARNING:
            LOG_WARN << "[TensorRT] " << msg;
            break;
        case Severity::kINFO:
            LOG_DEBUG << "[TensorRT] " << msg;
            break;
        default:
            LOG_TRACE << "[TensorRT] " << msg;
            break;
    }
}

TrtLogger& TrtLogger::getInstance() {
    static TrtLogger instance;
    return instance;
}
