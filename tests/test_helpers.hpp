#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <random>
#include <string>

namespace panel_promote::testing {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &tag) {
    std::random_device rd;
    path_ = fs::temp_directory_path() /
            ("panel_promote_" + tag + "_" + std::to_string(rd()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

// Deterministic high-frequency BGR texture.
inline cv::Mat noise_image(int width, int height, uint64_t seed = 1234) {
  cv::Mat img(height, width, CV_8UC3);
  cv::RNG rng(seed);
  rng.fill(img, cv::RNG::UNIFORM, 0, 256);
  return img;
}

} // namespace panel_promote::testing
