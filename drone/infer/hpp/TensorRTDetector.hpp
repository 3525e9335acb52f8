#ifndef TENSORRT_DETECTOR_HPP
#define TENSORRT_DETECTOR_HPP

#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "Detector.hpp"
#include "DetrPostprocessor.hpp"
#include "TensorPreprocessor.hpp"
#include "TensorRTEngine.hpp"

// 基于 TensorRT 的检测器 - 协调预处理、推理、后处理
class TensorRTDetector : public Detector {
public:
    explicit TensorRTDetector(int deviceId = 0);
    ~TensorRTDetector() override;

    bool loadModel(const std::string& modelPath, const std::string& classNamesPath = "");
    bool isModelLoaded() const { return engine.isModelLoaded(); }

    std::vector<RawDetection> detect(const cv::Mat& rgbImage, float confidenceThreshold) override;
    std::string modelName() const override;

    int getInputWidth() const { return preprocessor.getTargetWidth(); }
    int getInputHeight() const { return preprocessor.getTargetHeight(); }
    int getInputChannels() const { return preprocessor.getTargetChannels(); }

    // 每行一个类别名，行号即类别 id
    static std::vector<std::string> loadClassNames(const std::string& path);

private:
    std::mutex inferMutex;  // 单个执行上下文，推理串行
    TensorPreprocessor preprocessor;
    TensorRTEngine engine;
    DetrPostprocessor postprocessor;
    std::string modelFile;
};

#endif // TENSORRT_DETECTOR_HPP
