#pragma once

#include "panel_promote/core/types.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace panel_promote::image {

// Copy of the source region described by bounds. Throws PanelError when the
// region is empty or not fully inside the image.
cv::Mat extract_panel(const cv::Mat& source, const PanelBounds& bounds);

// Pads with black borders, centered, until width >= min_width and height >= min_height.
cv::Mat pad_to_minimum(const cv::Mat& img, int min_width, int min_height);

// Largest centered crop of a width x height image whose ratio is within
// tolerance of target_ratio. Only one axis shrinks unless integer rounding
// forces a smaller region on very small inputs.
cv::Rect compute_center_crop(int width, int height, double target_ratio,
                             double tolerance = 0.01);

// Pads undersized input to min_width x min_height, then center-crops to
// target_ratio. Never stretches.
cv::Mat center_fill_crop(const cv::Mat& img, double target_ratio,
                         int min_width = 64, int min_height = 36,
                         double tolerance = 0.01);

int interpolation_for_method(const std::string& method);

// Integer upscale; scale 1 returns a copy.
cv::Mat upscale_panel(const cv::Mat& img, int scale, const std::string& method);

} // namespace panel_promote::image
