#pragma once

#include "panel_promote/core/types.hpp"
#include <opencv2/core.hpp>

namespace panel_promote::io {

// Decodes any raster OpenCV understands into 8-bit BGR. Throws IOError when
// the file is missing or cannot be decoded.
cv::Mat read_image(const fs::path& path);

ImageSize image_size(const cv::Mat& img);

void write_png(const fs::path& path, const cv::Mat& img, int compression = 3);

} // namespace panel_promote::io
