#include "panel_promote/pipeline/reports.hpp"
#include "panel_promote/core/utils.hpp"
#include "panel_promote/seed/seed_deriver.hpp"

namespace panel_promote::pipeline {

namespace {

json warnings_json(const std::vector<std::string>& warnings) {
    json arr = json::array();
    for (const auto& w : warnings) arr.push_back(w);
    return arr;
}

json stats_json(const AggregateStats& s) {
    return {
        {"mean_sharpness", s.mean_sharpness},
        {"min_sharpness", s.min_sharpness},
        {"max_sharpness", s.max_sharpness},
        {"std_sharpness", s.std_sharpness},
        {"scored_panels", s.scored_panels}
    };
}

json path_or_null(const fs::path& p) {
    if (p.empty()) return nullptr;
    return p.string();
}

} // namespace

json bounds_to_json(const PanelBounds& b) {
    return {{"left", b.left}, {"top", b.top}, {"right", b.right}, {"bottom", b.bottom}};
}

json size_to_json(const ImageSize& s) {
    return {{"width", s.width}, {"height", s.height}};
}

json panel_metrics_json(const PanelResult& r) {
    json m = {
        {"panel_id", r.panel_id},
        {"grid_position", {r.grid_position.row, r.grid_position.col}},
        {"seed", r.seed},
        {"status", r.succeeded() ? "ok" : "failed"},
        {"warnings", warnings_json(r.warnings)}
    };
    if (r.succeeded()) {
        m["sharpness_score"] = r.sharpness_score;
        m["quality_tier"] = quality_tier_to_string(r.quality_tier);
        m["aspect_ratio"] = r.aspect_ratio;
    } else {
        m["sharpness_score"] = nullptr;
        m["quality_tier"] = nullptr;
        m["aspect_ratio"] = nullptr;
        m["error"] = r.error;
    }
    return m;
}

// Nothing run-specific goes in here, so identical inputs give a byte-identical
// file however panels were scheduled. panels arrive sorted by panel_id.
json build_qa_report_json(const std::vector<PanelResult>& panels, const QAReport& qa) {
    json metrics = json::array();
    for (const auto& p : panels) {
        metrics.push_back(panel_metrics_json(p));
    }
    return {
        {"panel_metrics", metrics},
        {"aggregate_stats", stats_json(qa.aggregate_stats)},
        {"validation_status", validation_status_to_string(qa.validation_status)},
        {"fail_reasons", warnings_json(qa.fail_reasons)},
        {"warnings", warnings_json(qa.warnings)},
        {"panels_total", qa.panels_total},
        {"panels_failed", qa.panels_failed}
    };
}

json build_promotion_summary_json(const SummaryInfo& info,
                                  const std::vector<PanelResult>& panels,
                                  const QAReport& qa,
                                  const std::vector<fs::path>& manifest) {
    json panel_entries = json::array();
    for (const auto& r : panels) {
        json e = {
            {"panel_id", r.panel_id},
            {"panel_index", r.panel_index},
            {"grid_position", {{"row", r.grid_position.row}, {"col", r.grid_position.col}}},
            {"state", panel_state_to_string(r.state)},
            {"last_state", panel_state_to_string(r.last_state)},
            {"seed", r.seed},
            // Everything needed to recompute the seed without this engine.
            {"seed_inputs", {
                {"global_seed", info.plan.global_seed},
                {"panel_id", r.panel_id},
                {"panel_hash", r.panel_hash},
                {"digest", seed::kSeedDigestVersion}
            }},
            {"bounds", bounds_to_json(r.bounds)},
            {"source_size", size_to_json(r.source_size)},
            {"cropped_size", size_to_json(r.cropped_size)},
            {"promoted_size", size_to_json(r.promoted_size)},
            {"cropped_path", path_or_null(r.cropped_path)},
            {"promoted_path", path_or_null(r.promoted_path)},
            {"warnings", warnings_json(r.warnings)}
        };
        // Payloads are only complete once the panel reached PAYLOAD_BUILT.
        if (r.succeeded()) {
            e["payload"] = r.payload;
        } else {
            e["payload"] = nullptr;
            e["error"] = r.error;
        }
        if (!r.dispatch_handle.empty()) e["dispatch_handle"] = r.dispatch_handle;
        if (!r.dispatch_error.empty()) e["dispatch_error"] = r.dispatch_error;
        panel_entries.push_back(std::move(e));
    }

    json files = json::array();
    for (const auto& p : manifest) files.push_back(p.string());

    return {
        {"run_id", info.run_id},
        {"started_at", info.started_at},
        {"finished_at", info.finished_at},
        {"engine_version", kEngineVersion},
        {"seed_digest", seed::kSeedDigestVersion},
        {"global_seed", info.plan.global_seed},
        {"grid_specification", info.plan.grid_specification},
        {"grid", {{"cols", info.grid.cols}, {"rows", info.grid.rows}}},
        {"master_grid_path", info.plan.master_grid_path.string()},
        {"master_grid_sha256", info.source_sha256},
        {"master_grid_size", size_to_json(info.source_size)},
        {"output_directory", info.plan.output_directory.string()},
        {"target_aspect_ratio", info.target_aspect_ratio},
        {"global_style_anchor", info.global_style_anchor},
        {"backend_schema", info.backend_schema},
        {"parallel_workers", info.parallel_workers},
        {"config", info.config_yaml},
        {"validation_status", validation_status_to_string(qa.validation_status)},
        {"panels", panel_entries},
        {"manifest", files}
    };
}

void write_json(const fs::path& path, const json& j) {
    core::write_text(path, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

} // namespace panel_promote::pipeline
