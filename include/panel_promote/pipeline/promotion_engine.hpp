#pragma once

#include "panel_promote/config/configuration.hpp"
#include "panel_promote/core/types.hpp"
#include "panel_promote/refinement/payload_builder.hpp"

#include <opencv2/core.hpp>
#include <atomic>
#include <ostream>
#include <string>
#include <vector>

namespace panel_promote::pipeline {

struct RunOptions {
    int parallel_workers = 0;                 // 0 = engine.parallel_workers from config
    const std::atomic<bool>* stop = nullptr;  // set to cancel; panels already written stay
    std::ostream* events = nullptr;           // JSON-lines run events, dropped when null
};

struct RunResult {
    std::string run_id;
    ValidationStatus validation_status = ValidationStatus::FAILED;
    fs::path output_directory;
    fs::path qa_report_path;
    fs::path summary_path;
    std::vector<fs::path> manifest;   // promoted images followed by both reports
    std::vector<PanelResult> panels;  // sorted by panel_id
    QAReport qa_report;
    int parallel_workers = 1;
};

// Stateless orchestrator: one instance may serve any number of sequential or
// concurrent process_grid calls. The optional backend receives every built
// payload after all panels finished; it is called from one thread at a time
// per run.
class PromotionEngine {
public:
    explicit PromotionEngine(config::Config cfg,
                             refinement::RefinementBackend* backend = nullptr);

    // Throws ValidationError / IOError / ConfigError before any file is
    // written when the plan or configuration is invalid, and StopRequested
    // when cancelled. Per-panel problems are reported in the result instead.
    RunResult process_grid(const PromotionPlan& plan, const RunOptions& options = {}) const;

    const config::Config& config() const { return cfg_; }

private:
    struct PreparedRun {
        GridSpec grid;
        cv::Mat source;
        std::string source_sha256;
        double target_ratio = 0.0;
        std::string style_anchor;
        refinement::BackendSchema schema = refinement::BackendSchema::COMFYUI;
        refinement::RefinementParams params;
    };

    PreparedRun prepare(const PromotionPlan& plan) const;

    PanelResult process_panel(const PanelSpec& spec, const PromotionPlan& plan,
                              const PreparedRun& run) const;

    config::Config cfg_;
    refinement::RefinementBackend* backend_ = nullptr;
};

} // namespace panel_promote::pipeline
