#include "tile_link/image/similarity.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace tile_link::image {

namespace {

constexpr double kFlatStd = 1e-3;

cv::Mat to_gray(const cv::Mat& image) {
    cv::Mat gray;
    switch (image.channels()) {
        case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        default: gray = image; break;
    }
    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    return gray;
}

} // namespace

cv::Mat prepare_for_match(const cv::Mat& image) {
    if (image.empty()) {
        return cv::Mat();
    }
    cv::Mat resized;
    cv::resize(to_gray(image), resized, cv::Size(kMatchCanvas, kMatchCanvas), 0, 0,
               cv::INTER_AREA);
    return resized;
}

float match_similarity(const cv::Mat& prepared_a, const cv::Mat& prepared_b) {
    if (prepared_a.empty() || prepared_b.empty() || prepared_a.size() != prepared_b.size() ||
        prepared_a.type() != prepared_b.type()) {
        return 0.0f;
    }

    cv::Scalar mean_a, std_a, mean_b, std_b;
    cv::meanStdDev(prepared_a, mean_a, std_a);
    cv::meanStdDev(prepared_b, mean_b, std_b);

    // TM_CCOEFF_NORMED is undefined for flat inputs
    const bool flat_a = std_a[0] < kFlatStd;
    const bool flat_b = std_b[0] < kFlatStd;
    if (flat_a && flat_b) {
        return static_cast<float>(1.0 - std::fabs(mean_a[0] - mean_b[0]) / 255.0);
    }
    if (flat_a || flat_b) {
        return 0.0f;
    }

    // Equal sizes give a single correlation coefficient
    cv::Mat result;
    cv::matchTemplate(prepared_a, prepared_b, result, cv::TM_CCOEFF_NORMED);
    const float score = result.at<float>(0, 0);
    if (!std::isfinite(score)) {
        return 0.0f;
    }
    return std::clamp(score, -1.0f, 1.0f);
}

cv::Mat center_crop(const cv::Mat& image, float ratio) {
    if (image.empty()) {
        return image;
    }
    const int h = image.rows;
    const int w = image.cols;
    const int ch = std::max(1, static_cast<int>(h * ratio));
    const int cw = std::max(1, static_cast<int>(w * ratio));
    const int y0 = std::max(0, (h - ch) / 2);
    const int x0 = std::max(0, (w - cw) / 2);
    return image(cv::Rect(x0, y0, std::min(cw, w - x0), std::min(ch, h - y0)));
}

float marked_ratio(const cv::Mat& cell_bgr, const config::ClassifierConfig& cfg) {
    cv::Mat cropped = center_crop(cell_bgr, cfg.center_crop_ratio);
    if (cropped.empty() || cropped.channels() != 3) {
        return 0.0f;
    }

    cv::Mat hsv;
    cv::cvtColor(cropped, hsv, cv::COLOR_BGR2HSV);

    cv::Mat mask = cv::Mat::zeros(hsv.size(), CV_8U);
    for (const auto& range : cfg.marked_hue_ranges) {
        cv::Mat part;
        cv::inRange(hsv,
                    cv::Scalar(range[0], cfg.marked_min_saturation, cfg.marked_min_value),
                    cv::Scalar(range[1], 255, 255), part);
        cv::bitwise_or(mask, part, mask);
    }
    return static_cast<float>(cv::countNonZero(mask)) / static_cast<float>(mask.total());
}

float texture_std(const cv::Mat& cell_bgr) {
    if (cell_bgr.empty()) {
        return 0.0f;
    }
    cv::Scalar mean, stddev;
    cv::meanStdDev(to_gray(cell_bgr), mean, stddev);
    return static_cast<float>(stddev[0]);
}

} // namespace tile_link::image
