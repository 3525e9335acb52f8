#ifndef THERMAL_RENDERER_HPP
#define THERMAL_RENDERER_HPP

#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

struct ThermalFrame {
    cv::Mat image;              // 伪彩色图（关闭时为原图）
    std::vector<uchar> jpeg;    // 关闭时为空
};

// 基于灰度强度的伪热成像渲染
class ThermalRenderer {
public:
    explicit ThermalRenderer(int jpegQuality = 85, int colormap = cv::COLORMAP_JET);

    ThermalFrame render(const cv::Mat& bgrImage, bool enabled) const;

    int getJpegQuality() const { return jpegQuality; }

private:
    int jpegQuality;
    int colormap;
};

#endif // THERMAL_RENDERER_HPP
