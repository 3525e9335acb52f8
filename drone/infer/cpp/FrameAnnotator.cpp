#include "../hpp/FrameAnnotator.hpp"
#include <algorithm>
#include <cstdio>
#include <functional>
#include <opencv2/imgproc.hpp>

cv::Mat FrameAnnotator::annotate(const cv::Mat& bgrFrame, const DetectionSet& detections) const {
    cv::Mat frame = bgrFrame.clone();
    for (const auto& detection : detections.detections) {
        const cv::Point topLeft(clampTo(detection.bbox[0], frame.cols), clampTo(detection.bbox[1], frame.rows));
        const cv::Point bottomRight(clampTo(detection.bbox[2], frame.cols), clampTo(detection.bbox[3], frame.rows));
        const cv::Scalar color = colorFor(detection.label);
        cv::rectangle(frame, topLeft, bottomRight, color, 2);

        char confText[16];
        std::snprintf(confText, sizeof(confText), "%.2f", detection.confidence);
        const std::string caption = detection.label + " " + confText;

        // 标签背景贴在框的上沿，放不下时移到框内
        int baseline = 0;
        const cv::Size textSize = cv::getTextSize(caption, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
        int textTop = topLeft.y - textSize.height - baseline - 4;
        if (textTop < 0) {
            textTop = topLeft.y;
        }
        const cv::Rect background(topLeft.x, textTop, textSize.width + 4, textSize.height + baseline + 4);
        cv::rectangle(frame, background & cv::Rect(0, 0, frame.cols, frame.rows), color, cv::FILLED);
        cv::putText(frame, caption,
                    cv::Point(topLeft.x + 2, textTop + textSize.height + 2),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
    }
    return frame;
}

// 先在浮点域裁剪到画面内再取整，超出 int 范围的坐标不能直接转换
int FrameAnnotator::clampTo(float value, int limit) {
    return static_cast<int>(std::max(0.0f, std::min(value, static_cast<float>(limit))));
}

cv::Scalar FrameAnnotator::colorFor(const std::string& label) const {
    const size_t h = std::hash<std::string>{}(label);
    return cv::Scalar(64 + (h & 0x7F), 64 + ((h >> 8) & 0x7F), 64 + ((h >> 16) & 0x7F));
}
