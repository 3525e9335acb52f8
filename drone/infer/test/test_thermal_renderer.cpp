#include <doctest/doctest.h>
#include <opencv2/imgcodecs.hpp>
#include "../hpp/ThermalRenderer.hpp"

TEST_CASE("enabled renderer produces a color map and jpeg") {
    cv::Mat image(60, 80, CV_8UC3);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));

    ThermalRenderer renderer;
    CHECK(renderer.getJpegQuality() == 85);
    ThermalFrame out = renderer.render(image, true);
    CHECK(out.image.size() == image.size());
    CHECK(out.image.type() == CV_8UC3);
    REQUIRE_FALSE(out.jpeg.empty());

    cv::Mat decoded = cv::imdecode(out.jpeg, cv::IMREAD_COLOR);
    CHECK(decoded.cols == 80);
    CHECK(decoded.rows == 60);
}

TEST_CASE("intensity drives the color") {
    cv::Mat dark(16, 16, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat bright(16, 16, CV_8UC3, cv::Scalar(255, 255, 255));
    ThermalRenderer renderer;
    cv::Vec3b cold = renderer.render(dark, true).image.at<cv::Vec3b>(0, 0);
    cv::Vec3b hot = renderer.render(bright, true).image.at<cv::Vec3b>(0, 0);
    // JET: 低强度偏蓝，高强度偏红
    CHECK(cold[0] > cold[2]);
    CHECK(hot[2] > hot[0]);
}

TEST_CASE("disabled renderer returns input and empty payload") {
    cv::Mat image(20, 20, CV_8UC3, cv::Scalar(10, 20, 30));
    ThermalRenderer renderer;
    ThermalFrame out = renderer.render(image, false);
    CHECK(out.jpeg.empty());
    CHECK(out.image.data == image.data);
}
