#include "panel_promote/core/errors.hpp"
#include "panel_promote/image/processing.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

#include <cmath>
#include <utility>
#include <vector>

using panel_promote::PanelBounds;
using panel_promote::PanelError;
using panel_promote::ValidationError;
namespace image = panel_promote::image;

TEST_CASE("center_crop_hits_ratio_without_upsampling") {
  const std::vector<double> ratios = {16.0 / 9.0, 4.0 / 3.0, 1.0, 2.35, 9.0 / 16.0};
  const std::vector<std::pair<int, int>> sizes = {
      {64, 36},   {100, 100}, {300, 300},  {640, 480},  {1920, 1080},
      {1080, 1920}, {301, 217}, {977, 131}, {131, 977}, {4000, 37}};

  for (double ratio : ratios) {
    for (const auto &[w, h] : sizes) {
      INFO("ratio " << ratio << " size " << w << "x" << h);
      cv::Mat src(h, w, CV_8UC3, cv::Scalar(10, 20, 30));
      cv::Mat out = image::center_fill_crop(src, ratio, 64, 36, 0.01);
      REQUIRE(out.cols <= w);
      REQUIRE(out.rows <= h);
      REQUIRE(out.cols >= 1);
      REQUIRE(out.rows >= 1);
      const double achieved = static_cast<double>(out.cols) / out.rows;
      REQUIRE(std::fabs(achieved - ratio) < 0.01);
    }
  }
}

TEST_CASE("center_crop_keeps_full_axis_when_rounding_allows") {
  cv::Rect wide = image::compute_center_crop(1000, 360, 16.0 / 9.0, 0.01);
  REQUIRE(wide.height == 360);
  REQUIRE(wide.width == 640);
  REQUIRE(wide.x == 180);
  REQUIRE(wide.y == 0);

  cv::Rect tall = image::compute_center_crop(320, 400, 16.0 / 9.0, 0.01);
  REQUIRE(tall.width == 320);
  REQUIRE(tall.height == 180);
  REQUIRE(tall.x == 0);
  REQUIRE(tall.y == 110);
}

TEST_CASE("center_crop_takes_the_middle_of_the_panel") {
  // Left third red, middle green, right third blue; a 1:1 crop keeps green only.
  cv::Mat src(100, 300, CV_8UC3, cv::Scalar(0, 0, 255));
  src(cv::Rect(100, 0, 100, 100)).setTo(cv::Scalar(0, 255, 0));
  src(cv::Rect(200, 0, 100, 100)).setTo(cv::Scalar(255, 0, 0));

  cv::Mat out = image::center_fill_crop(src, 1.0, 64, 36, 0.01);
  REQUIRE(out.cols == 100);
  REQUIRE(out.rows == 100);
  const cv::Vec3b c = out.at<cv::Vec3b>(50, 50);
  REQUIRE(c[1] == 255);
  REQUIRE(c[0] == 0);
  REQUIRE(c[2] == 0);
}

TEST_CASE("tiny_panel_is_padded_with_black_before_cropping") {
  cv::Mat src(10, 10, CV_8UC3, cv::Scalar(200, 200, 200));
  cv::Mat padded = image::pad_to_minimum(src, 64, 36);
  REQUIRE(padded.cols == 64);
  REQUIRE(padded.rows == 36);
  REQUIRE(padded.at<cv::Vec3b>(18, 32) == cv::Vec3b(200, 200, 200));
  REQUIRE(padded.at<cv::Vec3b>(0, 0) == cv::Vec3b(0, 0, 0));

  cv::Mat out = image::center_fill_crop(src, 16.0 / 9.0, 64, 36, 0.01);
  REQUIRE(out.cols == 64);
  REQUIRE(out.rows == 36);
}

TEST_CASE("center_crop_rejects_empty_and_invalid_input") {
  REQUIRE_THROWS_AS(image::center_fill_crop(cv::Mat(), 16.0 / 9.0, 64, 36, 0.01), PanelError);
  REQUIRE_THROWS_AS(image::compute_center_crop(0, 10, 1.0, 0.01), PanelError);
  REQUIRE_THROWS_AS(image::compute_center_crop(10, 10, 0.0, 0.01), PanelError);
}

TEST_CASE("extract_panel_copies_region") {
  cv::Mat src(90, 90, CV_8UC3, cv::Scalar(0, 0, 0));
  src(cv::Rect(30, 30, 30, 30)).setTo(cv::Scalar(9, 9, 9));

  cv::Mat panel = image::extract_panel(src, PanelBounds{30, 30, 60, 60});
  REQUIRE(panel.cols == 30);
  REQUIRE(panel.rows == 30);
  REQUIRE(panel.at<cv::Vec3b>(0, 0) == cv::Vec3b(9, 9, 9));

  panel.setTo(cv::Scalar(1, 1, 1));
  REQUIRE(src.at<cv::Vec3b>(30, 30) == cv::Vec3b(9, 9, 9));

  REQUIRE_THROWS_AS(image::extract_panel(src, PanelBounds{0, 0, 0, 0}), PanelError);
  REQUIRE_THROWS_AS(image::extract_panel(src, PanelBounds{60, 60, 120, 120}), PanelError);
}

TEST_CASE("upscale_multiplies_dimensions") {
  cv::Mat src(60, 100, CV_8UC3, cv::Scalar(1, 2, 3));
  for (const char *method : {"lanczos", "bicubic", "bilinear", "nearest"}) {
    INFO(method);
    cv::Mat out = image::upscale_panel(src, 2, method);
    REQUIRE(out.cols == 200);
    REQUIRE(out.rows == 120);
  }
  cv::Mat same = image::upscale_panel(src, 1, "lanczos");
  REQUIRE(same.cols == 100);
  REQUIRE(same.rows == 60);

  REQUIRE_THROWS_AS(image::upscale_panel(src, 2, "sinc"), ValidationError);
  REQUIRE_THROWS_AS(image::upscale_panel(src, 0, "lanczos"), ValidationError);
}
