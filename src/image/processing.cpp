#include "panel_promote/image/processing.hpp"
#include "panel_promote/core/errors.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>

namespace panel_promote::image {

cv::Mat extract_panel(const cv::Mat& source, const PanelBounds& bounds) {
    if (bounds.width() <= 0 || bounds.height() <= 0) {
        throw PanelError("empty panel region " + std::to_string(bounds.width()) + "x" +
                         std::to_string(bounds.height()) + " (source " +
                         std::to_string(source.cols) + "x" + std::to_string(source.rows) +
                         " is smaller than the grid)");
    }
    if (bounds.left < 0 || bounds.top < 0 ||
        bounds.right > source.cols || bounds.bottom > source.rows) {
        throw PanelError("panel region exceeds source image bounds");
    }
    cv::Rect roi(bounds.left, bounds.top, bounds.width(), bounds.height());
    return source(roi).clone();
}

cv::Mat pad_to_minimum(const cv::Mat& img, int min_width, int min_height) {
    const int pad_w = std::max(0, min_width - img.cols);
    const int pad_h = std::max(0, min_height - img.rows);
    if (pad_w == 0 && pad_h == 0) {
        return img;
    }

    // Odd padding puts the extra pixel on the right/bottom.
    const int left = pad_w / 2;
    const int top = pad_h / 2;
    cv::Mat out;
    cv::copyMakeBorder(img, out, top, pad_h - top, left, pad_w - left,
                       cv::BORDER_CONSTANT, cv::Scalar::all(0));
    return out;
}

cv::Rect compute_center_crop(int width, int height, double target_ratio, double tolerance) {
    if (width <= 0 || height <= 0) {
        throw PanelError("cannot crop an empty image");
    }
    if (!std::isfinite(target_ratio) || target_ratio <= 0.0) {
        throw PanelError("target aspect ratio must be a positive number");
    }

    auto within = [&](int w, int h) {
        return std::fabs(static_cast<double>(w) / static_cast<double>(h) - target_ratio) < tolerance;
    };
    auto centered = [&](int w, int h) {
        return cv::Rect((width - w) / 2, (height - h) / 2, w, h);
    };

    const double current = static_cast<double>(width) / static_cast<double>(height);
    if (current > target_ratio) {
        // Too wide: keep the height, narrow the width.
        for (int h = height; h >= 1; --h) {
            const int w = static_cast<int>(std::lround(h * target_ratio));
            if (w < 1 || w > width) continue;
            if (within(w, h)) return centered(w, h);
        }
    } else {
        // Too tall (or exact): keep the width, shorten the height.
        for (int w = width; w >= 1; --w) {
            const int h = static_cast<int>(std::lround(w / target_ratio));
            if (h < 1 || h > height) continue;
            if (within(w, h)) return centered(w, h);
        }
    }

    throw PanelError("no crop of " + std::to_string(width) + "x" + std::to_string(height) +
                     " reaches aspect ratio " + std::to_string(target_ratio));
}

cv::Mat center_fill_crop(const cv::Mat& img, double target_ratio,
                         int min_width, int min_height, double tolerance) {
    if (img.empty()) {
        throw PanelError("cannot crop an empty image");
    }
    cv::Mat padded = pad_to_minimum(img, min_width, min_height);
    cv::Rect r = compute_center_crop(padded.cols, padded.rows, target_ratio, tolerance);
    return padded(r).clone();
}

int interpolation_for_method(const std::string& method) {
    if (method == "lanczos") return cv::INTER_LANCZOS4;
    if (method == "bicubic") return cv::INTER_CUBIC;
    if (method == "bilinear") return cv::INTER_LINEAR;
    if (method == "nearest") return cv::INTER_NEAREST;
    throw ValidationError("unknown upscale method '" + method +
                          "' (use lanczos, bicubic, bilinear or nearest)");
}

cv::Mat upscale_panel(const cv::Mat& img, int scale, const std::string& method) {
    if (img.empty()) {
        throw PanelError("cannot upscale an empty image");
    }
    if (scale < 1) {
        throw ValidationError("upscale factor must be >= 1");
    }
    const int interpolation = interpolation_for_method(method);
    if (scale == 1) {
        return img.clone();
    }
    cv::Mat out;
    cv::resize(img, out, cv::Size(img.cols * scale, img.rows * scale), 0.0, 0.0, interpolation);
    return out;
}

} // namespace panel_promote::image
