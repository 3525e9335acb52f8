#include "../hpp/TensorRTEngine.hpp"
#include "../hpp/TensorPreprocessor.hpp"
#include "../hpp/TrtLogger.hpp"
#include "../hpp/VisionErrors.hpp"
#include <fstream>
#include <trantor/utils/Logger.h>

namespace {

void checkCuda(cudaError_t status, const char* what) {
    if (status != cudaSuccess) {
        throw ModelInferenceError(std::string(what) + ": " + cudaGetErrorString(status));
    }
}

size_t volume(const nvinfer1::Dims& dims) {
    size_t n = 1;
    for (int i = 0; i < dims.nbDims; ++i) {
        if (dims.d[i] <= 0) return 0;  // 动态维度不支持
        n *= static_cast<size_t>(dims.d[i]);
    }
    return n;
}

} // namespace

// ==================== TensorRTEngine 实现 ====================
TensorRTEngine::TensorRTEngine(int deviceId)
    : deviceId(deviceId), inputWidth(0), inputHeight(0), inputChannels(0),
      inputSize(0), boxesSize(0), logitsSize(0),
      dInput(nullptr), dBoxes(nullptr), dLogits(nullptr), stream(nullptr) {
}

TensorRTEngine::~TensorRTEngine() {
    cleanup();
}

bool TensorRTEngine::loadModel(const std::string& modelPath) {
    try {
        cudaError_t cudaStatus = cudaSetDevice(deviceId);
        if (cudaStatus != cudaSuccess) {
            LOG_ERROR << "Failed to set CUDA device " << deviceId << ": " << cudaGetErrorString(cudaStatus);
            return false;
        }

        // 读取 engine 文件
        std::ifstream file(modelPath, std::ios::binary | std::ios::ate);
        if (!file.good()) {
            LOG_ERROR << "Error opening engine file: " << modelPath;
            return false;
        }
        const std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);
        std::vector<char> engineData(static_cast<size_t>(size));
        if (size <= 0 || !file.read(engineData.data(), size)) {
            LOG_ERROR << "Error reading engine file: " << modelPath;
            return false;
        }

        runtime.reset(nvinfer1::createInferRuntime(TrtLogger::getInstance()));
        if (!runtime) {
            LOG_ERROR << "Failed to create TensorRT runtime";
            return false;
        }

        engine.reset(runtime->deserializeCudaEngine(engineData.data(), engineData.size()));
        if (!engine) {
            LOG_ERROR << "Failed to deserialize TensorRT engine";
            return false;
        }

        context.reset(engine->createExecutionContext());
        if (!context) {
            LOG_ERROR << "Failed to create TensorRT execution context";
            return false;
        }

        if (!inferTensorLayout()) {
            cleanup();
            return false;
        }
        if (!allocateMemory()) {
            cleanup();
            return false;
        }

        LOG_INFO << "Engine loaded: " << modelPath << " input " << inputWidth << "x"
                 << inputHeight << "x" << inputChannels;
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR << "Exception during model loading: " << e.what();
        cleanup();
        return false;
    }
}

EngineOutputs TensorRTEngine::executeInference(const TensorInput& input) {
    if (!isModelLoaded()) {
        throw ModelInferenceError("Model not loaded");
    }
    if (input.size() != inputSize) {
        throw ModelInferenceError("Input tensor size mismatch");
    }

    // 设备绑定按线程生效，请求线程与加载线程不同
    checkCuda(cudaSetDevice(deviceId), "cudaSetDevice");

    EngineOutputs outputs;
    outputs.boxes.resize(boxesSize);
    outputs.logits.resize(logitsSize);

    checkCuda(cudaMemcpyAsync(dInput, input.data.data(), inputSize * sizeof(float),
                              cudaMemcpyHostToDevice, stream), "cudaMemcpyAsync(input)");

    if (!context->enqueueV3(stream)) {
        throw ModelInferenceError("Failed to execute TensorRT inference");
    }

    checkCuda(cudaMemcpyAsync(outputs.boxes.data(), dBoxes, boxesSize * sizeof(float),
                              cudaMemcpyDeviceToHost, stream), "cudaMemcpyAsync(boxes)");
    checkCuda(cudaMemcpyAsync(outputs.logits.data(), dLogits, logitsSize * sizeof(float),
                              cudaMemcpyDeviceToHost, stream), "cudaMemcpyAsync(logits)");
    checkCuda(cudaStreamSynchronize(stream), "cudaStreamSynchronize");

    return outputs;
}

bool TensorRTEngine::inferTensorLayout() {
    const int nbTensors = engine->getNbIOTensors();
    if (nbTensors != 3) {
        LOG_ERROR << "Expected 1 input and 2 outputs, engine has " << nbTensors << " IO tensors";
        return false;
    }

    std::vector<std::string> outputNames;
    for (int i = 0; i < nbTensors; ++i) {
        const char* name = engine->getIOTensorName(i);
        if (engine->getTensorIOMode(name) == nvinfer1::TensorIOMode::kINPUT) {
            inputName = name;
        } else {
            outputNames.emplace_back(name);
        }
    }
    if (inputName.empty() || outputNames.size() != 2) {
        LOG_ERROR << "Unexpected IO tensor layout";
        return false;
    }

    auto inputShape = engine->getTensorShape(inputName.c_str());
    if (inputShape.nbDims == 4) {
        inputChannels = inputShape.d[1];
        inputHeight = inputShape.d[2];
        inputWidth = inputShape.d[3];
    } else if (inputShape.nbDims == 3) {
        inputChannels = inputShape.d[0];
        inputHeight = inputShape.d[1];
        inputWidth = inputShape.d[2];
    } else {
        LOG_ERROR << "Unexpected input dimensions: " << inputShape.nbDims;
        return false;
    }
    inputSize = volume(inputShape);

    // 最后一维为 4 的输出视为 boxes
    auto shape0 = engine->getTensorShape(outputNames[0].c_str());
    auto shape1 = engine->getTensorShape(outputNames[1].c_str());
    const bool firstIsBoxes = shape0.nbDims >= 2 && shape0.d[shape0.nbDims - 1] == 4;
    boxesName = firstIsBoxes ? outputNames[0] : outputNames[1];
    logitsName = firstIsBoxes ? outputNames[1] : outputNames[0];
    boxesSize = volume(firstIsBoxes ? shape0 : shape1);
    logitsSize = volume(firstIsBoxes ? shape1 : shape0);

    if (inputSize == 0 || boxesSize == 0 || logitsSize == 0) {
        LOG_ERROR << "Dynamic shapes are not supported";
        return false;
    }

    LOG_INFO << "Output tensors: boxes=" << boxesName << " (" << boxesSize << "), logits="
             << logitsName << " (" << logitsSize << ")";
    return true;
}

bool TensorRTEngine::allocateMemory() {
    try {
        checkCuda(cudaStreamCreate(&stream), "cudaStreamCreate");
        checkCuda(cudaMalloc(&dInput, inputSize * sizeof(float)), "cudaMalloc(input)");
        checkCuda(cudaMalloc(&dBoxes, boxesSize * sizeof(float)), "cudaMalloc(boxes)");
        checkCuda(cudaMalloc(&dLogits, logitsSize * sizeof(float)), "cudaMalloc(logits)");
    } catch (const ModelInferenceError& e) {
        LOG_ERROR << e.what();
        freeMemory();
        return false;
    }

    // 显存地址在加载时绑定一次
    return context->setTensorAddress(inputName.c_str(), dInput) &&
           context->setTensorAddress(boxesName.c_str(), dBoxes) &&
           context->setTensorAddress(logitsName.c_str(), dLogits);
}

void TensorRTEngine::freeMemory() {
    if (dInput) cudaFree(dInput);
    if (dBoxes) cudaFree(dBoxes);
    if (dLogits) cudaFree(dLogits);
    if (stream) cudaStreamDestroy(stream);
    dInput = dBoxes = dLogits = nullptr;
    stream = nullptr;
}

void TensorRTEngine::cleanup() {
    freeMemory();
    context.reset();
    engine.reset();
    runtime.reset();
}
