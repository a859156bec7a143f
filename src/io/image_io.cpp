#include "panel_promote/io/image_io.hpp"
#include "panel_promote/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>

namespace panel_promote::io {

namespace {

std::vector<int> png_params(int compression) {
    return {cv::IMWRITE_PNG_COMPRESSION, compression};
}

} // namespace

cv::Mat read_image(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Image not found: " + path.string());
    }
    if (!fs::is_regular_file(path)) {
        throw IOError("Image path is not a file: " + path.string());
    }
    // Alpha and 16-bit depth are dropped; panels are always 8-bit BGR.
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_COLOR);
    if (img.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    return img;
}

ImageSize image_size(const cv::Mat& img) {
    return ImageSize{img.cols, img.rows};
}

void write_png(const fs::path& path, const cv::Mat& img, int compression) {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img, png_params(compression));
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write PNG " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write PNG: " + path.string());
    }
}

} // namespace panel_promote::io
