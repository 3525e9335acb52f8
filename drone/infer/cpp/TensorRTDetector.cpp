#include "../hpp/TensorRTDetector.hpp"
#include "../hpp/VisionErrors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <trantor/utils/Logger.h>

// ==================== TensorRTDetector 实现 ====================
TensorRTDetector::TensorRTDetector(int deviceId)
    : engine(deviceId) {
}

TensorRTDetector::~TensorRTDetector() = default;

bool TensorRTDetector::loadModel(const std::string& modelPath, const std::string& classNamesPath) {
    std::lock_guard<std::mutex> lock(inferMutex);
    if (!engine.loadModel(modelPath)) {
        return false;
    }
    // 模型加载成功后更新预处理器和后处理器参数
    preprocessor.setTargetDimensions(engine.getInputWidth(),
                                     engine.getInputHeight(),
                                     engine.getInputChannels());
    if (!classNamesPath.empty()) {
        postprocessor.setClassNames(loadClassNames(classNamesPath));
        LOG_INFO << "Loaded " << postprocessor.getClassNames().size() << " class names from " << classNamesPath;
    }
    modelFile = std::filesystem::path(modelPath).filename().string();
    return true;
}

std::vector<RawDetection> TensorRTDetector::detect(const cv::Mat& rgbImage, float confidenceThreshold) {
    if (rgbImage.empty()) {
        throw ModelInferenceError("Input image is empty");
    }
    std::lock_guard<std::mutex> lock(inferMutex);
    if (!engine.isModelLoaded()) {
        throw ModelInferenceError("Engine not initialized");
    }

    using Clock = std::chrono::steady_clock;
    auto tStart = Clock::now();
    try {
        TensorInput input = preprocessor.preprocess(rgbImage);
        EngineOutputs outputs = engine.executeInference(input);
        std::vector<RawDetection> detections = postprocessor.postprocess(outputs, input, confidenceThreshold);

        LOG_DEBUG << "TensorRT detect: " << detections.size() << " detections in "
                  << std::chrono::duration<double, std::milli>(Clock::now() - tStart).count() << " ms";
        return detections;
    } catch (const ModelInferenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelInferenceError(std::string("Inference error: ") + e.what());
    }
}

std::string TensorRTDetector::modelName() const {
    return modelFile.empty() ? "TensorRT-DETR" : "TensorRT-DETR (" + modelFile + ")";
}

std::vector<std::string> TensorRTDetector::loadClassNames(const std::string& path) {
    std::vector<std::string> names;
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN << "Class names file not found: " << path;
        return names;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        names.push_back(line);
    }
    return names;
}
