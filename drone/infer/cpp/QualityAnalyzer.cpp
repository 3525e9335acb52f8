#include "../hpp/QualityAnalyzer.hpp"
#include <stdexcept>
#include <opencv2/imgproc.hpp>

QualityMetrics QualityAnalyzer::analyze(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("QualityAnalyzer: empty image");
    }
    cv::Mat gray = toGray(image);
    QualityMetrics metrics;

    // 1. 模糊度：Laplacian 方差
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar lapMean, lapStd;
    cv::meanStdDev(laplacian, lapMean, lapStd);
    metrics.blurScore = lapStd[0] * lapStd[0];

    // 2. 亮度
    cv::Scalar grayMean, grayStd;
    cv::meanStdDev(gray, grayMean, grayStd);
    metrics.brightnessMean = grayMean[0];
    metrics.brightnessStd = grayStd[0];

    // 3. 对比度（灰度标准差）
    metrics.contrast = grayStd[0];

    // 4. 锐度：Sobel 梯度幅值均值
    cv::Mat gradX, gradY, magnitude;
    cv::Sobel(gray, gradX, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gradY, CV_64F, 0, 1, 3);
    cv::magnitude(gradX, gradY, magnitude);
    metrics.sharpness = cv::mean(magnitude)[0];

    return metrics;
}

cv::Mat QualityAnalyzer::toGray(const cv::Mat& image) {
    if (image.channels() == 1) {
        return image;
    }
    cv::Mat gray;
    if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}
