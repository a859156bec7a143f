#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace panel_promote::config {

namespace fs = std::filesystem;

struct EngineConfig {
  int parallel_workers = 4;
  double target_aspect_ratio = 16.0 / 9.0;
  std::string backend = "comfyui"; // comfyui | automatic1111
};

struct CropConfig {
  int min_width = 64;  // panels below this are padded before cropping
  int min_height = 36;
  double ratio_tolerance = 0.01;
};

struct UpscaleConfig {
  bool enabled = true;
  int scale = 2;
  std::string method = "lanczos"; // lanczos | bicubic | bilinear | nearest
};

struct QAConfig {
  double too_soft_below = 50.0;
  double good_from = 100.0;
  double oversharpen_from = 500.0;
  double mean_sharpness_floor = 50.0;
  double aspect_fail_deviation = 0.05; // relative to the target ratio
};

struct RefinementConfig {
  std::string global_style_anchor;
  std::string negative_prompt =
      "blurry, low quality, distorted, artifacts, watermark, text";
  double denoising_strength = 0.35;
  double cfg_scale = 7.5;
  int steps = 30;
  std::string sampler_name = "euler";
  std::string scheduler = "normal";
  std::string model = "sd_xl_base_1.0.safetensors";
  bool restore_faces = false;
  bool tiling = false;
};

struct OutputConfig {
  bool write_cropped = false;
  std::string cropped_dir = "cropped";
  int png_compression = 3;
};

struct Config {
  EngineConfig engine;
  CropConfig crop;
  UpscaleConfig upscale;
  QAConfig qa;
  RefinementConfig refinement;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace panel_promote::config
