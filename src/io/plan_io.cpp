#include "panel_promote/io/plan_io.hpp"
#include "panel_promote/core/errors.hpp"
#include "panel_promote/core/utils.hpp"

#include <limits>

namespace panel_promote::io {

namespace {

const json& require(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ValidationError(where + " is missing required field '" + key + "'");
    }
    return j.at(key);
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require(j, key, where);
    if (!v.is_string()) {
        throw ValidationError(where + "." + key + " must be a string");
    }
    return v.get<std::string>();
}

// nlohmann stores non-negative literals as unsigned; both branches are range
// checked before narrowing so a huge index cannot wrap onto a real cell.
int as_position_int(const json& v, const std::string& what) {
    if (!v.is_number_integer()) {
        throw ValidationError(what + " must be an integer");
    }
    if (v.is_number_unsigned()) {
        const uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ValidationError(what + " is out of range");
        }
        return static_cast<int>(u);
    }
    const int64_t i = v.get<int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
        throw ValidationError(what + " is out of range");
    }
    return static_cast<int>(i);
}

int64_t as_seed(const json& v) {
    if (!v.is_number_integer()) {
        throw ValidationError("plan.global_seed must be an integer");
    }
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw ValidationError("plan.global_seed must fit in a signed 64-bit integer");
    }
    return v.get<int64_t>();
}

GridPosition parse_position(const json& v, const std::string& where) {
    GridPosition pos;
    if (v.is_array()) {
        if (v.size() != 2) {
            throw ValidationError(where + ".grid_position must be [row, col], e.g. [1, 2] "
                                  "is the second row, third column");
        }
        pos.row = as_position_int(v[0], where + ".grid_position[0] (row)");
        pos.col = as_position_int(v[1], where + ".grid_position[1] (col)");
    } else if (v.is_object()) {
        pos.row = as_position_int(require(v, "row", where + ".grid_position"),
                                  where + ".grid_position.row");
        pos.col = as_position_int(require(v, "col", where + ".grid_position"),
                                  where + ".grid_position.col");
    } else {
        throw ValidationError(where + ".grid_position must be [row, col] or {\"row\", \"col\"}");
    }
    return pos;
}

} // namespace

PromotionPlan plan_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("plan must be a JSON object");
    }

    PromotionPlan plan;
    plan.master_grid_path = require_string(j, "master_grid_path", "plan");
    plan.output_directory = require_string(j, "output_directory", "plan");
    plan.grid_specification = require_string(j, "grid_specification", "plan");

    plan.global_seed = as_seed(require(j, "global_seed", "plan"));

    if (j.contains("global_style_anchor") && !j.at("global_style_anchor").is_null()) {
        plan.global_style_anchor = require_string(j, "global_style_anchor", "plan");
    }
    if (j.contains("target_aspect_ratio") && !j.at("target_aspect_ratio").is_null()) {
        const json& r = j.at("target_aspect_ratio");
        if (!r.is_number()) {
            throw ValidationError("plan.target_aspect_ratio must be a number");
        }
        plan.target_aspect_ratio = r.get<double>();
    }

    const json& panels = require(j, "panels", "plan");
    if (!panels.is_array()) {
        throw ValidationError("plan.panels must be an array");
    }
    for (size_t i = 0; i < panels.size(); ++i) {
        const json& p = panels[i];
        const std::string where = "plan.panels[" + std::to_string(i) + "]";
        if (!p.is_object()) {
            throw ValidationError(where + " must be an object");
        }
        PanelSpec spec;
        spec.panel_id = require_string(p, "panel_id", where);
        spec.grid_position = parse_position(require(p, "grid_position", where), where);
        if (p.contains("prompt_extension") && !p.at("prompt_extension").is_null()) {
            spec.prompt_extension = require_string(p, "prompt_extension", where);
        }
        plan.panels.push_back(std::move(spec));
    }

    return plan;
}

// Paths in the plan are relative to the plan file, not the working directory.
PromotionPlan load_plan(const fs::path& path) {
    const std::string text = core::read_text(path);
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError("cannot parse plan " + path.string() + ": " + e.what());
    }

    PromotionPlan plan = plan_from_json(j);
    const fs::path base = fs::absolute(path).parent_path();
    if (plan.master_grid_path.is_relative()) {
        plan.master_grid_path = base / plan.master_grid_path;
    }
    if (plan.output_directory.is_relative()) {
        plan.output_directory = base / plan.output_directory;
    }
    return plan;
}

json plan_to_json(const PromotionPlan& plan) {
    json panels = json::array();
    for (const auto& p : plan.panels) {
        panels.push_back({
            {"panel_id", p.panel_id},
            {"grid_position", {p.grid_position.row, p.grid_position.col}},
            {"prompt_extension", p.prompt_extension}
        });
    }

    json j = {
        {"master_grid_path", plan.master_grid_path.string()},
        {"output_directory", plan.output_directory.string()},
        {"grid_specification", plan.grid_specification},
        {"global_seed", plan.global_seed},
        {"panels", panels}
    };
    if (plan.global_style_anchor) j["global_style_anchor"] = *plan.global_style_anchor;
    if (plan.target_aspect_ratio) j["target_aspect_ratio"] = *plan.target_aspect_ratio;
    return j;
}

} // namespace panel_promote::io
