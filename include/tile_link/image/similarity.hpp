#pragma once

#include "tile_link/config/configuration.hpp"

#include <opencv2/core.hpp>

namespace tile_link::image {

// Side length of the canvas crops are normalized onto before matching
constexpr int kMatchCanvas = 32;

// Grayscale, resized to kMatchCanvas x kMatchCanvas with area interpolation.
// Returns an empty Mat for an empty input.
cv::Mat prepare_for_match(const cv::Mat& image);

// Normalized cross-correlation of two prepared crops, in [-1, 1].
// Flat crops: both flat -> 1 - |mean_a - mean_b| / 255, exactly one flat -> 0.
float match_similarity(const cv::Mat& prepared_a, const cv::Mat& prepared_b);

// Centered sub-crop covering ratio of each side (at least one pixel).
cv::Mat center_crop(const cv::Mat& image, float ratio);

// Fraction of center-crop pixels whose HSV value falls in one of the marked
// hue ranges with saturation/value at or above the configured minimums.
float marked_ratio(const cv::Mat& cell_bgr, const config::ClassifierConfig& cfg);

// Grayscale standard deviation of the cell
float texture_std(const cv::Mat& cell_bgr);

} // namespace tile_link::image
