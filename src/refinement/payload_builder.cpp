#include "panel_promote/refinement/payload_builder.hpp"
#include "panel_promote/core/errors.hpp"
#include "panel_promote/core/utils.hpp"

namespace panel_promote::refinement {

std::string backend_schema_to_string(BackendSchema schema) {
    switch (schema) {
        case BackendSchema::COMFYUI: return "comfyui";
        case BackendSchema::AUTOMATIC1111: return "automatic1111";
        default: return "unknown";
    }
}

BackendSchema parse_backend_schema(const std::string& name) {
    const std::string n = core::to_lower(core::trim(name));
    if (n == "comfyui") return BackendSchema::COMFYUI;
    if (n == "automatic1111" || n == "a1111") return BackendSchema::AUTOMATIC1111;
    throw ValidationError("unknown refinement backend '" + name +
                          "' (use comfyui or automatic1111)");
}

RefinementParams RefinementParams::from_config(const config::RefinementConfig& cfg) {
    RefinementParams p;
    p.negative_prompt = cfg.negative_prompt;
    p.denoising_strength = cfg.denoising_strength;
    p.cfg_scale = cfg.cfg_scale;
    p.steps = cfg.steps;
    p.sampler_name = cfg.sampler_name;
    p.scheduler = cfg.scheduler;
    p.model = cfg.model;
    p.restore_faces = cfg.restore_faces;
    p.tiling = cfg.tiling;
    return p;
}

void RefinementParams::validate() const {
    if (denoising_strength < 0.0 || denoising_strength > 1.0) {
        throw ValidationError("denoising_strength must be in [0,1]");
    }
    if (cfg_scale <= 0.0) {
        throw ValidationError("cfg_scale must be > 0");
    }
    if (steps < 1) {
        throw ValidationError("steps must be >= 1");
    }
}

std::string build_prompt(const std::string& global_style_anchor,
                         const std::string& prompt_extension) {
    const std::string anchor = core::trim(global_style_anchor);
    const std::string ext = core::trim(prompt_extension);
    std::string prompt = anchor;
    if (!prompt.empty() && !ext.empty()) prompt += " ";
    prompt += ext;
    return prompt + ", highly detailed, 8k";
}

json build_comfyui_payload(const PayloadInput& in, const RefinementParams& params) {
    return {
        {"input_image", in.image_path.string()},
        {"prompt", build_prompt(in.global_style_anchor, in.prompt_extension)},
        {"negative_prompt", params.negative_prompt},
        {"denoising_strength", params.denoising_strength},
        {"seed", in.seed},
        {"cfg_scale", params.cfg_scale},
        {"steps", params.steps},
        {"sampler_name", params.sampler_name},
        {"scheduler", params.scheduler},
        {"model", params.model},
        {"width", in.width},
        {"height", in.height}
    };
}

json build_automatic1111_payload(const PayloadInput& in, const RefinementParams& params) {
    if (in.image_png.empty()) {
        throw PanelError("automatic1111 payload requires encoded image bytes");
    }
    // The image travels inline, so the request is self-contained.
    return {
        {"init_images", json::array({core::base64_encode(in.image_png)})},
        {"prompt", build_prompt(in.global_style_anchor, in.prompt_extension)},
        {"negative_prompt", params.negative_prompt},
        {"denoising_strength", params.denoising_strength},
        {"seed", in.seed},
        {"cfg_scale", params.cfg_scale},
        {"steps", params.steps},
        {"sampler_index", params.sampler_name},
        {"width", in.width},
        {"height", in.height},
        {"restore_faces", params.restore_faces},
        {"tiling", params.tiling}
    };
}

json build_payload(BackendSchema schema, const PayloadInput& in, const RefinementParams& params) {
    switch (schema) {
        case BackendSchema::COMFYUI: return build_comfyui_payload(in, params);
        case BackendSchema::AUTOMATIC1111: return build_automatic1111_payload(in, params);
    }
    throw PipelineError("unhandled backend schema");
}

// Fields both schemas carry under the same name; sampler and image keys differ.
json logical_values(const json& payload) {
    static const char* kShared[] = {"prompt", "negative_prompt", "seed", "denoising_strength",
                                    "cfg_scale", "steps", "width", "height"};
    json out = json::object();
    for (const char* key : kShared) {
        if (payload.contains(key)) out[key] = payload.at(key);
    }
    return out;
}

} // namespace panel_promote::refinement
