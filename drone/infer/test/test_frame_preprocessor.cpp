#include <doctest/doctest.h>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include "../hpp/FramePreprocessor.hpp"
#include "../hpp/ImageUtils.hpp"
#include "../hpp/QualityAnalyzer.hpp"
#include "../hpp/VisionErrors.hpp"

namespace {

cv::Mat gradient(int width, int height) {
    cv::Mat img(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            img.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x % 256),
                                                static_cast<uchar>(y % 256),
                                                static_cast<uchar>((x + y) % 256));
        }
    }
    return img;
}

} // namespace

TEST_CASE("oversized frame is downscaled keeping aspect ratio") {
    FramePreprocessor pre;
    FramePreprocessor::Options opts;

    PreparedFrame a = pre.prepare(gradient(2560, 1440), opts);
    CHECK(a.resolution == "1280x720");
    CHECK(a.modelInput.cols == 1280);
    CHECK(a.modelInput.rows == 720);

    // scale = min(1280/2000, 720/500) = 0.64
    PreparedFrame b = pre.prepare(gradient(2000, 500), opts);
    CHECK(b.resolution == "1280x320");
}

TEST_CASE("small frame passes through unchanged in size") {
    FramePreprocessor pre;
    PreparedFrame f = pre.prepare(gradient(640, 480), FramePreprocessor::Options());
    CHECK(f.resolution == "640x480");
    CHECK(f.enhancedBgr.size() == cv::Size(640, 480));
    CHECK(f.modelInput.channels() == 3);
    CHECK(f.preprocessTimeMs >= 0.0);
}

TEST_CASE("custom max frame size") {
    FramePreprocessor pre;
    FramePreprocessor::Options opts;
    opts.maxFrameSize = cv::Size(320, 240);
    PreparedFrame f = pre.prepare(gradient(640, 480), opts);
    CHECK(f.resolution == "320x240");
}

TEST_CASE("quality is computed before enhancement") {
    FramePreprocessor pre;
    cv::Mat image = gradient(320, 240);

    FramePreprocessor::Options opts;
    opts.enableClahe = true;
    PreparedFrame f = pre.prepare(image, opts);
    REQUIRE(f.quality.has_value());

    QualityMetrics expected = QualityAnalyzer::analyze(image);
    CHECK(f.quality->blurScore == doctest::Approx(expected.blurScore));
    CHECK(f.quality->brightnessMean == doctest::Approx(expected.brightnessMean));
    CHECK(f.quality->sharpness == doctest::Approx(expected.sharpness));
}

TEST_CASE("quality analysis can be disabled") {
    FramePreprocessor pre;
    FramePreprocessor::Options opts;
    opts.enableQuality = false;
    PreparedFrame f = pre.prepare(gradient(64, 64), opts);
    CHECK_FALSE(f.quality.has_value());
}

TEST_CASE("without clahe the model input is the RGB frame") {
    FramePreprocessor pre;
    FramePreprocessor::Options opts;
    opts.enableClahe = false;
    cv::Mat image = gradient(100, 80);
    PreparedFrame f = pre.prepare(image, opts);

    cv::Mat rgb;
    cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
    CHECK(cv::norm(f.modelInput, rgb, cv::NORM_INF) == doctest::Approx(0.0));
}

TEST_CASE("clahe stretches a low contrast frame") {
    FramePreprocessor pre;
    cv::Mat dull(128, 128, CV_8UC3);
    cv::randu(dull, cv::Scalar::all(100), cv::Scalar::all(120));

    PreparedFrame f = pre.prepare(dull, FramePreprocessor::Options());
    cv::Mat before, after;
    cv::cvtColor(dull, before, cv::COLOR_BGR2GRAY);
    cv::cvtColor(f.enhancedBgr, after, cv::COLOR_BGR2GRAY);

    cv::Scalar m0, s0, m1, s1;
    cv::meanStdDev(before, m0, s0);
    cv::meanStdDev(after, m1, s1);
    CHECK(s1[0] > s0[0]);
    CHECK(pre.getClipLimit() == doctest::Approx(2.0));
    CHECK(pre.getTileGrid() == cv::Size(8, 8));
}

TEST_CASE("clahe changes luminance only") {
    // 偏暖色底色 + 三通道相同的灰度噪声：亮度对比低，增强后不会超出色域
    cv::Mat noise(128, 128, CV_8UC1);
    cv::randu(noise, cv::Scalar(0), cv::Scalar(20));
    cv::Mat tinted(128, 128, CV_8UC3);
    for (int y = 0; y < tinted.rows; ++y) {
        for (int x = 0; x < tinted.cols; ++x) {
            const uchar n = noise.at<uchar>(y, x);
            tinted.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(100 + n), static_cast<uchar>(110 + n),
                                                   static_cast<uchar>(135 + n));
        }
    }
    FramePreprocessor pre;
    PreparedFrame f = pre.prepare(tinted, FramePreprocessor::Options());

    cv::Mat labBefore, labAfter;
    cv::cvtColor(tinted, labBefore, cv::COLOR_BGR2Lab);
    cv::cvtColor(f.enhancedBgr, labAfter, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> before, after;
    cv::split(labBefore, before);
    cv::split(labAfter, after);

    cv::Mat diff;
    cv::absdiff(before[0], after[0], diff);
    CHECK(cv::mean(diff)[0] > 2.0);

    // a/b 只允许 Lab 往返的量化误差
    for (int c = 1; c <= 2; ++c) {
        cv::absdiff(before[c], after[c], diff);
        CHECK(cv::mean(diff)[0] <= 1.0);
        double maxDiff = 0.0;
        cv::minMaxLoc(diff, nullptr, &maxDiff);
        CHECK(maxDiff <= 3.0);
    }
}

TEST_CASE("encoded bytes are decoded") {
    FramePreprocessor pre;
    std::vector<uchar> jpeg = visionUtils::encode_jpeg(gradient(200, 100), 90);
    PreparedFrame f = pre.prepare(jpeg, FramePreprocessor::Options());
    CHECK(f.resolution == "200x100");
}

TEST_CASE("invalid bytes raise DecodeError") {
    FramePreprocessor pre;
    FramePreprocessor::Options opts;
    CHECK_THROWS_AS(pre.prepare(std::vector<uchar>(), opts), DecodeError);

    std::vector<uchar> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    CHECK_THROWS_AS(pre.prepare(garbage, opts), DecodeError);

    // 截断的 JPEG 头
    std::vector<uchar> truncated = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10};
    CHECK_THROWS_AS(pre.prepare(truncated, opts), DecodeError);
}

TEST_CASE("non 3-channel mat is rejected") {
    FramePreprocessor pre;
    CHECK_THROWS_AS(pre.prepare(cv::Mat(10, 10, CV_8UC1), FramePreprocessor::Options()), std::invalid_argument);
    CHECK_THROWS_AS(pre.prepare(cv::Mat(), FramePreprocessor::Options()), std::invalid_argument);
}
