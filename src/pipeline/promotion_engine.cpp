#include "panel_promote/pipeline/promotion_engine.hpp"
#include "panel_promote/core/errors.hpp"
#include "panel_promote/core/events.hpp"
#include "panel_promote/core/utils.hpp"
#include "panel_promote/grid/grid_slicer.hpp"
#include "panel_promote/image/processing.hpp"
#include "panel_promote/io/image_io.hpp"
#include "panel_promote/metrics/sharpness.hpp"
#include "panel_promote/pipeline/reports.hpp"
#include "panel_promote/seed/seed_deriver.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace panel_promote::pipeline {

namespace {

// index is the 1-based row-major grid cell, so names do not depend on the
// order panels are listed in the plan.
std::string panel_file_name(int index, const std::string& suffix) {
    return "panel_" + core::zero_pad(index, 2) + "_" + suffix + ".png";
}

std::string config_to_yaml_text(const config::Config& cfg) {
    YAML::Emitter emitter;
    emitter << cfg.to_yaml();
    return emitter.c_str();
}

bool stop_requested(const RunOptions& options) {
    return options.stop != nullptr && options.stop->load();
}

} // namespace

PromotionEngine::PromotionEngine(config::Config cfg, refinement::RefinementBackend* backend)
    : cfg_(std::move(cfg)), backend_(backend) {}

PromotionEngine::PreparedRun PromotionEngine::prepare(const PromotionPlan& plan) const {
    cfg_.validate();

    PreparedRun run;
    run.grid = grid::parse_grid_spec(plan.grid_specification);
    grid::validate_grid_positions(plan.panels, run.grid);

    if (plan.output_directory.empty()) {
        throw ValidationError("output_directory must not be empty");
    }
    if (plan.master_grid_path.empty()) {
        throw ValidationError("master_grid_path must not be empty");
    }

    run.target_ratio = plan.target_aspect_ratio.value_or(cfg_.engine.target_aspect_ratio);
    if (!std::isfinite(run.target_ratio) || run.target_ratio <= 0.0) {
        throw ValidationError("target_aspect_ratio must be a positive number");
    }

    run.schema = backend_ ? backend_->schema()
                          : refinement::parse_backend_schema(cfg_.engine.backend);
    run.params = refinement::RefinementParams::from_config(cfg_.refinement);
    run.params.validate();
    run.style_anchor = plan.global_style_anchor.value_or(cfg_.refinement.global_style_anchor);
    if (!core::is_valid_utf8(run.style_anchor)) {
        throw ValidationError("global_style_anchor must be valid UTF-8");
    }
    for (const auto& p : plan.panels) {
        if (!core::is_valid_utf8(p.prompt_extension)) {
            throw ValidationError("prompt_extension of panel '" + p.panel_id +
                                  "' must be valid UTF-8");
        }
    }

    run.source = io::read_image(plan.master_grid_path);
    run.source_sha256 = core::sha256_file(plan.master_grid_path);
    return run;
}

PanelResult PromotionEngine::process_panel(const PanelSpec& spec, const PromotionPlan& plan,
                                           const PreparedRun& run) const {
    PanelResult r;
    r.panel_id = spec.panel_id;
    r.grid_position = spec.grid_position;
    r.panel_index = grid::panel_index(spec.grid_position, run.grid);

    auto advance = [&r](PanelState s) {
        r.state = s;
        r.last_state = s;
    };

    try {
        // SLICED
        r.bounds = grid::compute_panel_bounds(spec.grid_position, run.grid,
                                              io::image_size(run.source));
        cv::Mat slice = image::extract_panel(run.source, r.bounds);
        r.source_size = io::image_size(slice);
        advance(PanelState::SLICED);

        // CROPPED
        if (slice.cols < cfg_.crop.min_width || slice.rows < cfg_.crop.min_height) {
            r.warnings.push_back("padded from " + std::to_string(slice.cols) + "x" +
                                 std::to_string(slice.rows) + " to minimum " +
                                 std::to_string(cfg_.crop.min_width) + "x" +
                                 std::to_string(cfg_.crop.min_height));
        }
        cv::Mat cropped = image::center_fill_crop(slice, run.target_ratio,
                                                  cfg_.crop.min_width, cfg_.crop.min_height,
                                                  cfg_.crop.ratio_tolerance);
        r.cropped_size = io::image_size(cropped);
        r.aspect_ratio = static_cast<double>(cropped.cols) / static_cast<double>(cropped.rows);

        if (cfg_.output.write_cropped) {
            r.cropped_path = plan.output_directory / cfg_.output.cropped_dir /
                             panel_file_name(r.panel_index, "cropped");
            io::write_png(r.cropped_path, cropped, cfg_.output.png_compression);
        }

        cv::Mat promoted = cfg_.upscale.enabled
                               ? image::upscale_panel(cropped, cfg_.upscale.scale, cfg_.upscale.method)
                               : cropped;
        r.promoted_size = io::image_size(promoted);
        r.promoted_path = plan.output_directory / panel_file_name(r.panel_index, "promoted");
        io::write_png(r.promoted_path, promoted, cfg_.output.png_compression);
        advance(PanelState::CROPPED);

        // SEEDED
        r.panel_hash = seed::panel_hash(spec.panel_id);
        r.seed = seed::derive_seed(plan.global_seed, spec.panel_id);
        advance(PanelState::SEEDED);

        // SCORED (on the cropped panel, before resampling)
        r.sharpness_score = metrics::score_sharpness(cropped);
        r.quality_tier = metrics::classify_sharpness(r.sharpness_score, cfg_.qa);
        for (auto& w : metrics::panel_quality_warnings(r.sharpness_score, cfg_.qa)) {
            r.warnings.push_back(std::move(w));
        }
        advance(PanelState::SCORED);

        // PAYLOAD_BUILT
        refinement::PayloadInput in;
        in.image_path = r.promoted_path;
        if (run.schema == refinement::BackendSchema::AUTOMATIC1111) {
            in.image_png = core::read_bytes(r.promoted_path);
        }
        in.global_style_anchor = run.style_anchor;
        in.prompt_extension = spec.prompt_extension;
        in.seed = r.seed;
        in.width = promoted.cols;
        in.height = promoted.rows;
        r.payload = refinement::build_payload(run.schema, in, run.params);
        advance(PanelState::PAYLOAD_BUILT);
    } catch (const std::exception& e) {
        r.state = PanelState::SKIPPED_ON_FAIL;
        r.error = e.what();
    }

    return r;
}

RunResult PromotionEngine::process_grid(const PromotionPlan& plan, const RunOptions& options) const {
    std::ostream null_out(nullptr);
    std::ostream& log_file = options.events ? *options.events : null_out;

    core::EventEmitter emitter;
    RunResult result;
    result.run_id = core::get_run_id();
    result.output_directory = plan.output_directory;
    const std::string& run_id = result.run_id;
    const std::string started_at = core::get_iso_timestamp();

    emitter.run_start(run_id,
                      {{"master_grid_path", plan.master_grid_path.string()},
                       {"output_directory", plan.output_directory.string()},
                       {"grid_specification", plan.grid_specification},
                       {"global_seed", plan.global_seed},
                       {"panels", plan.panels.size()}},
                      log_file);

    // VALIDATING_INPUT
    emitter.phase_start(run_id, Phase::VALIDATING_INPUT, log_file);
    PreparedRun run;
    try {
        run = prepare(plan);
    } catch (const PanelPromoteError& e) {
        emitter.error(run_id, e.what(), log_file);
        emitter.phase_end(run_id, Phase::VALIDATING_INPUT, "error", {{"error", e.what()}}, log_file);
        emitter.run_end(run_id, false, "error", log_file);
        throw;
    }

    const ImageSize source_size = io::image_size(run.source);
    if (source_size.width % run.grid.cols != 0 || source_size.height % run.grid.rows != 0) {
        emitter.warning(run_id,
                        "source " + std::to_string(source_size.width) + "x" +
                            std::to_string(source_size.height) + " is not divisible by grid " +
                            plan.grid_specification + "; " +
                            std::to_string(source_size.width % run.grid.cols) + " px right and " +
                            std::to_string(source_size.height % run.grid.rows) +
                            " px bottom are excluded from all panels",
                        log_file);
    }
    if (cfg_.upscale.enabled && cfg_.upscale.scale > 4) {
        emitter.warning(run_id,
                        "large upscale factor (" + std::to_string(cfg_.upscale.scale) +
                            "x) may produce very large files",
                        log_file);
    }
    emitter.phase_end(run_id, Phase::VALIDATING_INPUT, "ok",
                      {{"grid", {{"cols", run.grid.cols}, {"rows", run.grid.rows}}},
                       {"source_width", source_size.width},
                       {"source_height", source_size.height},
                       {"target_aspect_ratio", run.target_ratio},
                       {"backend_schema", refinement::backend_schema_to_string(run.schema)}},
                      log_file);

    if (stop_requested(options)) {
        emitter.run_end(run_id, false, "cancelled", log_file);
        throw StopRequested();
    }

    try {
        fs::create_directories(plan.output_directory);
        if (cfg_.output.write_cropped) {
            fs::create_directories(plan.output_directory / cfg_.output.cropped_dir);
        }
    } catch (const fs::filesystem_error& e) {
        emitter.run_end(run_id, false, "error", log_file);
        throw IOError("Cannot create output directory " + plan.output_directory.string() +
                      ": " + e.what());
    }

    // PROCESSING_PANELS
    emitter.phase_start(run_id, Phase::PROCESSING_PANELS, log_file);

    const size_t n_panels = plan.panels.size();
    int workers = options.parallel_workers > 0 ? options.parallel_workers
                                               : cfg_.engine.parallel_workers;
    workers = std::max(1, std::min(workers, static_cast<int>(n_panels)));
    result.parallel_workers = workers;

    std::vector<PanelResult> panels(n_panels);
    std::vector<char> processed(n_panels, 0);
    std::mutex event_mutex;
    std::atomic<size_t> next_panel{0};
    std::atomic<int> panels_done{0};
    std::atomic<bool> worker_failed{false};
    std::exception_ptr worker_error;

    // Anything escaping a worker thread would terminate the process, so the
    // first exception is parked and rethrown after the join.
    auto process_next = [&]() {
        try {
            while (true) {
                if (stop_requested(options) || worker_failed.load())
                    break;
                size_t pi = next_panel.fetch_add(1);
                if (pi >= n_panels)
                    break;
                panels[pi] = process_panel(plan.panels[pi], plan, run);
                processed[pi] = 1;
                int done = ++panels_done;
                std::lock_guard<std::mutex> lock(event_mutex);
                emitter.panel_processed(run_id, panels[pi], done, static_cast<int>(n_panels), log_file);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(event_mutex);
            if (!worker_error) {
                worker_error = std::current_exception();
            }
            worker_failed.store(true);
        }
    };

    if (workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back(process_next);
        }
        for (auto& t : pool) {
            t.join();
        }
    } else {
        process_next();
    }

    if (worker_error) {
        emitter.phase_end(run_id, Phase::PROCESSING_PANELS, "error",
                          {{"panels_done", panels_done.load()}}, log_file);
        emitter.run_end(run_id, false, "error", log_file);
        std::rethrow_exception(worker_error);
    }

    const bool all_processed = std::all_of(processed.begin(), processed.end(),
                                           [](char c) { return c != 0; });
    if (!all_processed) {
        emitter.phase_end(run_id, Phase::PROCESSING_PANELS, "cancelled",
                          {{"panels_done", panels_done.load()}}, log_file);
        emitter.run_end(run_id, false, "cancelled", log_file);
        throw StopRequested();
    }

    // Dispatch is a separate, sequential step in plan order.
    if (backend_) {
        for (auto& p : panels) {
            if (!p.succeeded())
                continue;
            try {
                p.dispatch_handle = backend_->submit_refinement(p.payload);
            } catch (const std::exception& e) {
                p.dispatch_error = e.what();
                emitter.warning(run_id, p.panel_id + ": refinement dispatch failed: " + e.what(),
                                log_file);
            }
        }
    }

    const int failed = static_cast<int>(std::count_if(
        panels.begin(), panels.end(), [](const PanelResult& p) { return !p.succeeded(); }));
    emitter.phase_end(run_id, Phase::PROCESSING_PANELS, failed == 0 ? "ok" : "partial",
                      {{"panels_total", n_panels}, {"panels_failed", failed},
                       {"parallel_workers", workers}},
                      log_file);

    // AGGREGATING
    emitter.phase_start(run_id, Phase::AGGREGATING, log_file);

    std::sort(panels.begin(), panels.end(),
              [](const PanelResult& a, const PanelResult& b) { return a.panel_id < b.panel_id; });
    result.qa_report = metrics::evaluate_run(panels, run.target_ratio, cfg_.qa);
    result.validation_status = result.qa_report.validation_status;

    std::vector<PanelResult> by_index = panels;
    std::sort(by_index.begin(), by_index.end(),
              [](const PanelResult& a, const PanelResult& b) { return a.panel_index < b.panel_index; });
    for (const auto& p : by_index) {
        if (p.last_state != PanelState::PENDING && p.last_state != PanelState::SLICED) {
            result.manifest.push_back(p.promoted_path);
        }
    }
    result.qa_report_path = plan.output_directory / kQaReportFile;
    result.summary_path = plan.output_directory / kSummaryFile;
    result.manifest.push_back(result.qa_report_path);
    result.manifest.push_back(result.summary_path);

    SummaryInfo info;
    info.run_id = run_id;
    info.started_at = started_at;
    info.plan = plan;
    info.grid = run.grid;
    info.source_size = source_size;
    info.source_sha256 = run.source_sha256;
    info.target_aspect_ratio = run.target_ratio;
    info.global_style_anchor = run.style_anchor;
    info.backend_schema = refinement::backend_schema_to_string(run.schema);
    info.parallel_workers = workers;
    info.config_yaml = config_to_yaml_text(cfg_);

    try {
        write_json(result.qa_report_path, build_qa_report_json(panels, result.qa_report));
        info.finished_at = core::get_iso_timestamp();
        write_json(result.summary_path,
                   build_promotion_summary_json(info, panels, result.qa_report, result.manifest));
    } catch (const PanelPromoteError& e) {
        emitter.phase_end(run_id, Phase::AGGREGATING, "error", {{"error", e.what()}}, log_file);
        emitter.run_end(run_id, false, "error", log_file);
        throw;
    }

    const std::string status = validation_status_to_string(result.validation_status);
    emitter.phase_end(run_id, Phase::AGGREGATING, "ok",
                      {{"validation_status", status},
                       {"mean_sharpness", result.qa_report.aggregate_stats.mean_sharpness},
                       {"fail_reasons", result.qa_report.fail_reasons}},
                      log_file);
    emitter.run_end(run_id, result.validation_status != ValidationStatus::FAILED, status, log_file);

    result.panels = std::move(panels);
    return result;
}

} // namespace panel_promote::pipeline
