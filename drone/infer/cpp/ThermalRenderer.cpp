#include "../hpp/ThermalRenderer.hpp"
#include "../hpp/ImageUtils.hpp"
#include <opencv2/imgproc.hpp>

ThermalRenderer::ThermalRenderer(int jpegQuality, int colormap)
    : jpegQuality(jpegQuality), colormap(colormap) {
}

ThermalFrame ThermalRenderer::render(const cv::Mat& bgrImage, bool enabled) const {
    ThermalFrame out;
    if (!enabled) {
        out.image = bgrImage;
        return out;
    }

    cv::Mat gray;
    if (bgrImage.channels() == 1) {
        gray = bgrImage;
    } else {
        cv::cvtColor(bgrImage, gray, cv::COLOR_BGR2GRAY);
    }
    cv::applyColorMap(gray, out.image, colormap);
    out.jpeg = visionUtils::encode_jpeg(out.image, jpegQuality);
    return out;
}
