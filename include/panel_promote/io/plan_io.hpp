#pragma once

#include "panel_promote/core/types.hpp"
#include <nlohmann/json.hpp>

namespace panel_promote::io {

using json = nlohmann::json;

// Field-level parsing only; grid and position invariants are checked by the
// engine. grid_position accepts [row, col] or {"row": r, "col": c}.
PromotionPlan plan_from_json(const json& j);

// Relative master_grid_path / output_directory are resolved against the
// directory containing the plan file.
PromotionPlan load_plan(const fs::path& path);

json plan_to_json(const PromotionPlan& plan);

} // namespace panel_promote::io
