#include "panel_promote/config/configuration.hpp"
#include "panel_promote/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace panel_promote::config {

static bool is_known_backend(const std::string& b) {
    return b == "comfyui" || b == "automatic1111" || b == "a1111";
}

static bool is_known_upscale_method(const std::string& m) {
    return m == "lanczos" || m == "bicubic" || m == "bilinear" || m == "nearest";
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["engine"]) {
        auto e = node["engine"];
        if (e["parallel_workers"]) cfg.engine.parallel_workers = e["parallel_workers"].as<int>();
        if (e["target_aspect_ratio"]) cfg.engine.target_aspect_ratio = e["target_aspect_ratio"].as<double>();
        if (e["backend"]) cfg.engine.backend = e["backend"].as<std::string>();
    }

    if (node["crop"]) {
        auto c = node["crop"];
        if (c["min_width"]) cfg.crop.min_width = c["min_width"].as<int>();
        if (c["min_height"]) cfg.crop.min_height = c["min_height"].as<int>();
        if (c["ratio_tolerance"]) cfg.crop.ratio_tolerance = c["ratio_tolerance"].as<double>();
    }

    if (node["upscale"]) {
        auto u = node["upscale"];
        if (u["enabled"]) cfg.upscale.enabled = u["enabled"].as<bool>();
        if (u["scale"]) cfg.upscale.scale = u["scale"].as<int>();
        if (u["method"]) cfg.upscale.method = u["method"].as<std::string>();
    }

    if (node["qa"]) {
        auto q = node["qa"];
        if (q["too_soft_below"]) cfg.qa.too_soft_below = q["too_soft_below"].as<double>();
        if (q["good_from"]) cfg.qa.good_from = q["good_from"].as<double>();
        if (q["oversharpen_from"]) cfg.qa.oversharpen_from = q["oversharpen_from"].as<double>();
        if (q["mean_sharpness_floor"]) cfg.qa.mean_sharpness_floor = q["mean_sharpness_floor"].as<double>();
        if (q["aspect_fail_deviation"]) cfg.qa.aspect_fail_deviation = q["aspect_fail_deviation"].as<double>();
    }

    if (node["refinement"]) {
        auto r = node["refinement"];
        if (r["global_style_anchor"]) cfg.refinement.global_style_anchor = r["global_style_anchor"].as<std::string>();
        if (r["negative_prompt"]) cfg.refinement.negative_prompt = r["negative_prompt"].as<std::string>();
        if (r["denoising_strength"]) cfg.refinement.denoising_strength = r["denoising_strength"].as<double>();
        if (r["cfg_scale"]) cfg.refinement.cfg_scale = r["cfg_scale"].as<double>();
        if (r["steps"]) cfg.refinement.steps = r["steps"].as<int>();
        if (r["sampler_name"]) cfg.refinement.sampler_name = r["sampler_name"].as<std::string>();
        if (r["scheduler"]) cfg.refinement.scheduler = r["scheduler"].as<std::string>();
        if (r["model"]) cfg.refinement.model = r["model"].as<std::string>();
        if (r["restore_faces"]) cfg.refinement.restore_faces = r["restore_faces"].as<bool>();
        if (r["tiling"]) cfg.refinement.tiling = r["tiling"].as<bool>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["write_cropped"]) cfg.output.write_cropped = o["write_cropped"].as<bool>();
        if (o["cropped_dir"]) cfg.output.cropped_dir = o["cropped_dir"].as<std::string>();
        if (o["png_compression"]) cfg.output.png_compression = o["png_compression"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["engine"]["parallel_workers"] = engine.parallel_workers;
    node["engine"]["target_aspect_ratio"] = engine.target_aspect_ratio;
    node["engine"]["backend"] = engine.backend;

    node["crop"]["min_width"] = crop.min_width;
    node["crop"]["min_height"] = crop.min_height;
    node["crop"]["ratio_tolerance"] = crop.ratio_tolerance;

    node["upscale"]["enabled"] = upscale.enabled;
    node["upscale"]["scale"] = upscale.scale;
    node["upscale"]["method"] = upscale.method;

    node["qa"]["too_soft_below"] = qa.too_soft_below;
    node["qa"]["good_from"] = qa.good_from;
    node["qa"]["oversharpen_from"] = qa.oversharpen_from;
    node["qa"]["mean_sharpness_floor"] = qa.mean_sharpness_floor;
    node["qa"]["aspect_fail_deviation"] = qa.aspect_fail_deviation;

    node["refinement"]["global_style_anchor"] = refinement.global_style_anchor;
    node["refinement"]["negative_prompt"] = refinement.negative_prompt;
    node["refinement"]["denoising_strength"] = refinement.denoising_strength;
    node["refinement"]["cfg_scale"] = refinement.cfg_scale;
    node["refinement"]["steps"] = refinement.steps;
    node["refinement"]["sampler_name"] = refinement.sampler_name;
    node["refinement"]["scheduler"] = refinement.scheduler;
    node["refinement"]["model"] = refinement.model;
    node["refinement"]["restore_faces"] = refinement.restore_faces;
    node["refinement"]["tiling"] = refinement.tiling;

    node["output"]["write_cropped"] = output.write_cropped;
    node["output"]["cropped_dir"] = output.cropped_dir;
    node["output"]["png_compression"] = output.png_compression;

    return node;
}

void Config::validate() const {
    if (engine.parallel_workers < 1 || engine.parallel_workers > 64) {
        throw ValidationError("engine.parallel_workers must be in [1,64]");
    }
    if (!std::isfinite(engine.target_aspect_ratio) || engine.target_aspect_ratio <= 0.0) {
        throw ValidationError("engine.target_aspect_ratio must be > 0");
    }
    if (!is_known_backend(engine.backend)) {
        throw ValidationError("engine.backend must be 'comfyui' or 'automatic1111'");
    }

    if (crop.min_width < 1 || crop.min_height < 1) {
        throw ValidationError("crop.min_width and crop.min_height must be >= 1");
    }
    if (crop.ratio_tolerance <= 0.0 || crop.ratio_tolerance > 0.5) {
        throw ValidationError("crop.ratio_tolerance must be in (0,0.5]");
    }

    if (upscale.scale < 1 || upscale.scale > 8) {
        throw ValidationError("upscale.scale must be in [1,8]");
    }
    if (!is_known_upscale_method(upscale.method)) {
        throw ValidationError("upscale.method must be one of lanczos, bicubic, bilinear, nearest");
    }

    if (qa.too_soft_below < 0.0) {
        throw ValidationError("qa.too_soft_below must be >= 0");
    }
    if (qa.good_from < qa.too_soft_below) {
        throw ValidationError("qa.good_from must be >= qa.too_soft_below");
    }
    if (qa.oversharpen_from < qa.good_from) {
        throw ValidationError("qa.oversharpen_from must be >= qa.good_from");
    }
    if (qa.mean_sharpness_floor < 0.0) {
        throw ValidationError("qa.mean_sharpness_floor must be >= 0");
    }
    if (qa.aspect_fail_deviation <= 0.0 || qa.aspect_fail_deviation > 1.0) {
        throw ValidationError("qa.aspect_fail_deviation must be in (0,1]");
    }

    if (refinement.denoising_strength < 0.0 || refinement.denoising_strength > 1.0) {
        throw ValidationError("refinement.denoising_strength must be in [0,1]");
    }
    if (refinement.cfg_scale <= 0.0) {
        throw ValidationError("refinement.cfg_scale must be > 0");
    }
    if (refinement.steps < 1 || refinement.steps > 500) {
        throw ValidationError("refinement.steps must be in [1,500]");
    }

    if (output.cropped_dir.empty()) {
        throw ValidationError("output.cropped_dir must not be empty");
    }
    if (output.png_compression < 0 || output.png_compression > 9) {
        throw ValidationError("output.png_compression must be in [0,9]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "title": "panel_promote configuration",
  "type": "object",
  "properties": {
    "engine": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64},
        "target_aspect_ratio": {"type": "number", "exclusiveMinimum": 0},
        "backend": {"type": "string", "enum": ["comfyui", "automatic1111", "a1111"]}
      }
    },
    "crop": {
      "type": "object",
      "properties": {
        "min_width": {"type": "integer", "minimum": 1},
        "min_height": {"type": "integer", "minimum": 1},
        "ratio_tolerance": {"type": "number", "exclusiveMinimum": 0, "maximum": 0.5}
      }
    },
    "upscale": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "scale": {"type": "integer", "minimum": 1, "maximum": 8},
        "method": {"type": "string", "enum": ["lanczos", "bicubic", "bilinear", "nearest"]}
      }
    },
    "qa": {
      "type": "object",
      "properties": {
        "too_soft_below": {"type": "number", "minimum": 0},
        "good_from": {"type": "number", "minimum": 0},
        "oversharpen_from": {"type": "number", "minimum": 0},
        "mean_sharpness_floor": {"type": "number", "minimum": 0},
        "aspect_fail_deviation": {"type": "number", "exclusiveMinimum": 0, "maximum": 1}
      }
    },
    "refinement": {
      "type": "object",
      "properties": {
        "global_style_anchor": {"type": "string"},
        "negative_prompt": {"type": "string"},
        "denoising_strength": {"type": "number", "minimum": 0, "maximum": 1},
        "cfg_scale": {"type": "number", "exclusiveMinimum": 0},
        "steps": {"type": "integer", "minimum": 1, "maximum": 500},
        "sampler_name": {"type": "string"},
        "scheduler": {"type": "string"},
        "model": {"type": "string"},
        "restore_faces": {"type": "boolean"},
        "tiling": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "write_cropped": {"type": "boolean"},
        "cropped_dir": {"type": "string"},
        "png_compression": {"type": "integer", "minimum": 0, "maximum": 9}
      }
    }
  }
})";
}

} // namespace panel_promote::config
