#pragma once

#include "panel_promote/config/configuration.hpp"
#include "panel_promote/core/types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace panel_promote::refinement {

using json = nlohmann::json;

enum class BackendSchema {
    COMFYUI,
    AUTOMATIC1111
};

std::string backend_schema_to_string(BackendSchema schema);

// Accepts "comfyui", "automatic1111" and "a1111" (case-insensitive).
BackendSchema parse_backend_schema(const std::string& name);

struct RefinementParams {
    std::string negative_prompt;
    double denoising_strength = 0.35;
    double cfg_scale = 7.5;
    int steps = 30;
    std::string sampler_name = "euler";
    std::string scheduler = "normal";
    std::string model;
    bool restore_faces = false;
    bool tiling = false;

    static RefinementParams from_config(const config::RefinementConfig& cfg);
    void validate() const;
};

// Everything a payload needs about one panel.
struct PayloadInput {
    fs::path image_path;
    std::vector<uint8_t> image_png;   // only read by the Automatic1111 shape
    std::string global_style_anchor;
    std::string prompt_extension;
    int64_t seed = 0;
    int width = 0;
    int height = 0;
};

// "{anchor} {extension}, highly detailed, 8k"
std::string build_prompt(const std::string& global_style_anchor,
                         const std::string& prompt_extension);

json build_comfyui_payload(const PayloadInput& in, const RefinementParams& params);
json build_automatic1111_payload(const PayloadInput& in, const RefinementParams& params);
json build_payload(BackendSchema schema, const PayloadInput& in, const RefinementParams& params);

// Schema-independent view of a payload: prompt, negative_prompt, seed,
// denoising_strength, cfg_scale, steps, width, height.
json logical_values(const json& payload);

// Capability to hand a payload to a diffusion service. The engine never
// performs network I/O itself.
class RefinementBackend {
public:
    virtual ~RefinementBackend() = default;

    virtual BackendSchema schema() const = 0;

    // Returns an opaque handle identifying the submitted job.
    virtual std::string submit_refinement(const json& payload) = 0;
};

} // namespace panel_promote::refinement
