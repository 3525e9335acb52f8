#ifndef TENSORRT_ENGINE_HPP
#define TENSORRT_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>
#include <NvInfer.h>
#include <cuda_runtime.h>

struct TensorInput;

// 引擎输出：boxes (N x 4, cxcywh 归一化) 与 logits (N x C)
struct EngineOutputs {
    std::vector<float> boxes;
    std::vector<float> logits;
};

// TensorRT 推理引擎 - 负责模型加载、显存管理、推理执行
// 非线程安全，调用方负责串行化
class TensorRTEngine {
public:
    explicit TensorRTEngine(int deviceId = 0);
    ~TensorRTEngine();

    TensorRTEngine(const TensorRTEngine&) = delete;
    TensorRTEngine& operator=(const TensorRTEngine&) = delete;

    bool loadModel(const std::string& modelPath);
    bool isModelLoaded() const { return engine != nullptr && context != nullptr; }

    // 失败抛 ModelInferenceError
    EngineOutputs executeInference(const TensorInput& input);

    int getInputWidth() const { return inputWidth; }
    int getInputHeight() const { return inputHeight; }
    int getInputChannels() const { return inputChannels; }
    size_t getBoxesSize() const { return boxesSize; }
    size_t getLogitsSize() const { return logitsSize; }

private:
    std::unique_ptr<nvinfer1::IRuntime> runtime;
    std::unique_ptr<nvinfer1::ICudaEngine> engine;
    std::unique_ptr<nvinfer1::IExecutionContext> context;

    int deviceId;
    int inputWidth;
    int inputHeight;
    int inputChannels;
    size_t inputSize;
    size_t boxesSize;
    size_t logitsSize;

    std::string inputName;
    std::string boxesName;
    std::string logitsName;

    void* dInput;
    void* dBoxes;
    void* dLogits;
    cudaStream_t stream;

    void cleanup();
    bool allocateMemory();
    void freeMemory();
    bool inferTensorLayout();
};

#endif // TENSORRT_ENGINE_HPP
