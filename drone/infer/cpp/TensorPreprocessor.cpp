#include "../hpp/TensorPreprocessor.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

TensorPreprocessor::TensorPreprocessor(int targetWidth, int targetHeight, int targetChannels)
    : targetWidth(targetWidth), targetHeight(targetHeight), targetChannels(targetChannels) {
    // ImageNet 均值/标准差（RGB 顺序）
    meanScalar   = cv::Scalar(0.485f, 0.456f, 0.406f);
    invStdScalar = cv::Scalar(1.0f / 0.229f, 1.0f / 0.224f, 1.0f / 0.225f);
}

void TensorPreprocessor::setTargetDimensions(int width, int height, int channels) {
    targetWidth = width;
    targetHeight = height;
    targetChannels = channels;
    flattenedDataBuf.clear();
    dstPlanes.clear();
}

void TensorPreprocessor::ensureDestinationBuffers() {
    const int planeSize = targetWidth * targetHeight;
    if (static_cast<int>(flattenedDataBuf.size()) != planeSize * targetChannels) {
        flattenedDataBuf.assign(static_cast<size_t>(planeSize) * targetChannels, 0.0f);
        // 每个通道一个平面视图，mixChannels 直接写入
        dstPlanes.clear();
        dstPlanes.reserve(targetChannels);
        for (int c = 0; c < targetChannels; ++c) {
            dstPlanes.emplace_back(targetHeight, targetWidth, CV_32F,
                                   flattenedDataBuf.data() + static_cast<size_t>(c) * planeSize);
        }
    }
}

TensorInput TensorPreprocessor::preprocess(const cv::Mat& rgbImage) {
    if (targetWidth <= 0 || targetHeight <= 0 || targetChannels != 3) {
        throw std::runtime_error("TensorPreprocessor: target dimensions not set");
    }
    const int ow = rgbImage.cols;
    const int oh = rgbImage.rows;

    // 1) 等比缩放，只在右/下补 114
    float scale = std::min(static_cast<float>(targetWidth) / std::max(1, ow),
                           static_cast<float>(targetHeight) / std::max(1, oh));
    int newW = std::max(1, static_cast<int>(std::round(ow * scale)));
    int newH = std::max(1, static_cast<int>(std::round(oh * scale)));
    newW = std::min(newW, targetWidth);
    newH = std::min(newH, targetHeight);

    cv::Mat resized;
    cv::resize(rgbImage, resized, cv::Size(newW, newH));
    cv::Mat letterboxed;
    cv::copyMakeBorder(resized, letterboxed, 0, targetHeight - newH, 0, targetWidth - newW,
                       cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));

    // 2) 归一化，保持 HWC
    f32Buf.create(targetHeight, targetWidth, CV_32FC3);
    letterboxed.convertTo(f32Buf, CV_32FC3, 1.0 / 255.0);
    cv::subtract(f32Buf, meanScalar, f32Buf);
    cv::multiply(f32Buf, invStdScalar, f32Buf);

    // 3) HWC -> CHW，输入已是 RGB，通道一一对应
    ensureDestinationBuffers();
    const cv::Mat srcs[1] = { f32Buf };
    const int fromTo[6] = { 0,0, 1,1, 2,2 };
    cv::mixChannels(srcs, 1, dstPlanes.data(), targetChannels, fromTo, 3);

    TensorInput out;
    out.data = flattenedDataBuf;
    out.width = targetWidth;
    out.height = targetHeight;
    out.channels = targetChannels;
    out.originalWidth = ow;
    out.originalHeight = oh;
    out.scale = scale;
    return out;
}
