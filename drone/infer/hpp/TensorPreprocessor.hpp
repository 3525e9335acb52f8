#ifndef TENSOR_PREPROCESSOR_HPP
#define TENSOR_PREPROCESSOR_HPP

#include <vector>
#include <opencv2/core.hpp>

// 送入 TensorRT 的输入张量（CHW float）及还原坐标所需的信息
struct TensorInput {
    std::vector<float> data;
    int width{0};
    int height{0};
    int channels{0};
    int originalWidth{0};
    int originalHeight{0};
    float scale{1.0f};
    size_t size() const { return data.size(); }
};

// letterbox 缩放 + ImageNet 归一化 + HWC->CHW
class TensorPreprocessor {
public:
    explicit TensorPreprocessor(int targetWidth = 0, int targetHeight = 0, int targetChannels = 0);

    void setTargetDimensions(int width, int height, int channels);

    // 输入为 RGB 8UC3
    TensorInput preprocess(const cv::Mat& rgbImage);

    int getTargetWidth() const { return targetWidth; }
    int getTargetHeight() const { return targetHeight; }
    int getTargetChannels() const { return targetChannels; }

private:
    int targetWidth;
    int targetHeight;
    int targetChannels;

    cv::Scalar meanScalar;
    cv::Scalar invStdScalar;

    // 复用的中间缓冲
    cv::Mat f32Buf;
    std::vector<float> flattenedDataBuf;
    std::vector<cv::Mat> dstPlanes;

    void ensureDestinationBuffers();
};

#endif // TENSOR_PREPROCESSOR_HPP
