#pragma once

#include "panel_promote/core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace panel_promote::pipeline {

using json = nlohmann::json;

constexpr const char* kEngineVersion = "1.0.0";
constexpr const char* kQaReportFile = "qa_report.json";
constexpr const char* kSummaryFile = "promotion_summary.json";

// Run-level facts recorded in promotion_summary.json next to the panels.
struct SummaryInfo {
    std::string run_id;
    std::string started_at;
    std::string finished_at;
    PromotionPlan plan;
    GridSpec grid;
    ImageSize source_size;
    std::string source_sha256;
    double target_aspect_ratio = 0.0;
    std::string global_style_anchor;
    std::string backend_schema;
    int parallel_workers = 1;
    std::string config_yaml;
};

json bounds_to_json(const PanelBounds& b);
json size_to_json(const ImageSize& s);

// Entry of qa_report.json "panel_metrics"; contains no paths or timestamps.
json panel_metrics_json(const PanelResult& r);

json build_qa_report_json(const std::vector<PanelResult>& panels, const QAReport& qa);

json build_promotion_summary_json(const SummaryInfo& info,
                                  const std::vector<PanelResult>& panels,
                                  const QAReport& qa,
                                  const std::vector<fs::path>& manifest);

void write_json(const fs::path& path, const json& j);

} // namespace panel_promote::pipeline
