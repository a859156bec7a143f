#include "runner_shared.hpp"

#include "panel_promote/config/configuration.hpp"
#include "panel_promote/core/errors.hpp"
#include "panel_promote/core/types.hpp"
#include "panel_promote/grid/grid_slicer.hpp"
#include "panel_promote/io/image_io.hpp"
#include "panel_promote/io/plan_io.hpp"
#include "panel_promote/metrics/sharpness.hpp"
#include "panel_promote/pipeline/promotion_engine.hpp"
#include "panel_promote/seed/seed_deriver.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace panel_promote;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailedRun = 1;
constexpr int kExitInvalid = 2;
constexpr int kExitIO = 3;
constexpr int kExitCancelled = 130;

std::atomic<bool> g_stop{false};

void handle_sigint(int) { g_stop.store(true); }

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

config::Config load_config(const std::string& config_path) {
    config::Config cfg = config_path.empty() ? config::Config{} : config::Config::load(config_path);
    cfg.validate();
    return cfg;
}

int run_command(const std::string& plan_path, const std::string& config_path,
                int workers, const std::string& backend, const std::string& log_path) {
    config::Config cfg = load_config(config_path);
    if (!backend.empty()) {
        cfg.engine.backend = backend;
    }
    if (workers > 0) {
        cfg.engine.parallel_workers = workers;
    }
    cfg.validate();

    PromotionPlan plan = io::load_plan(plan_path);

    std::ofstream event_log_file;
    std::unique_ptr<runner::TeeBuf> tee_buf;
    std::ostream log_file(std::cout.rdbuf());
    if (!log_path.empty()) {
        event_log_file.open(log_path, std::ios::out | std::ios::trunc);
        if (!event_log_file) {
            throw IOError("Cannot open log file: " + log_path);
        }
        tee_buf = std::make_unique<runner::TeeBuf>(std::cout.rdbuf(), event_log_file.rdbuf());
        log_file.rdbuf(tee_buf.get());
    }

    std::signal(SIGINT, handle_sigint);

    pipeline::PromotionEngine engine(cfg);
    pipeline::RunOptions options;
    options.stop = &g_stop;
    options.events = &log_file;

    pipeline::RunResult result = engine.process_grid(plan, options);
    log_file.flush();

    std::cout << "Run ID: " << result.run_id << "\n"
              << "Output: " << result.output_directory.string() << "\n"
              << "Workers: " << result.parallel_workers << "\n";
    for (const auto& p : result.panels) {
        std::cout << "  " << std::left << std::setw(16) << p.panel_id;
        if (p.succeeded()) {
            std::cout << "seed=" << p.seed << " sharpness=" << std::fixed << std::setprecision(2)
                      << p.sharpness_score << " (" << quality_tier_to_string(p.quality_tier)
                      << ")\n";
        } else {
            std::cout << "FAILED at " << panel_state_to_string(p.last_state) << ": " << p.error
                      << "\n";
        }
    }
    for (const auto& reason : result.qa_report.fail_reasons) {
        std::cout << "Fail: " << reason << "\n";
    }
    std::cout << "Status: " << validation_status_to_string(result.validation_status) << std::endl;

    return result.validation_status == ValidationStatus::FAILED ? kExitFailedRun : kExitOk;
}

int validate_plan_command(const std::string& plan_path) {
    PromotionPlan plan = io::load_plan(plan_path);
    GridSpec grid = grid::parse_grid_spec(plan.grid_specification);
    grid::validate_grid_positions(plan.panels, grid);
    cv::Mat source = io::read_image(plan.master_grid_path);
    ImageSize size = io::image_size(source);

    json panels = json::array();
    for (const auto& p : plan.panels) {
        PanelBounds b = grid::compute_panel_bounds(p.grid_position, grid, size);
        panels.push_back({{"panel_id", p.panel_id},
                          {"panel_index", grid::panel_index(p.grid_position, grid)},
                          {"bounds", {b.left, b.top, b.right, b.bottom}},
                          {"seed", seed::derive_seed(plan.global_seed, p.panel_id)}});
    }

    print_json({{"valid", true},
                {"grid", {{"cols", grid.cols}, {"rows", grid.rows}}},
                {"master_grid_size", {{"width", size.width}, {"height", size.height}}},
                {"panels", panels}});
    return kExitOk;
}

int derive_seed_command(long long global_seed, const std::string& panel_id) {
    print_json({{"panel_id", panel_id},
                {"global_seed", global_seed},
                {"panel_hash", seed::panel_hash(panel_id)},
                {"seed", seed::derive_seed(global_seed, panel_id)},
                {"digest", seed::kSeedDigestVersion}});
    return kExitOk;
}

int score_command(const std::string& image_path, const std::string& config_path) {
    config::Config cfg = load_config(config_path);
    cv::Mat img = io::read_image(image_path);
    const double score = metrics::score_sharpness(img);
    print_json({{"image", image_path},
                {"width", img.cols},
                {"height", img.rows},
                {"sharpness_score", score},
                {"quality_tier", quality_tier_to_string(metrics::classify_sharpness(score, cfg.qa))},
                {"warnings", metrics::panel_quality_warnings(score, cfg.qa)}});
    return kExitOk;
}

int default_config_command(const std::string& out_path) {
    config::Config cfg;
    if (!out_path.empty()) {
        cfg.save(out_path);
        std::cout << "Wrote " << out_path << std::endl;
        return kExitOk;
    }
    YAML::Emitter emitter;
    emitter << cfg.to_yaml();
    std::cout << emitter.c_str() << std::endl;
    return kExitOk;
}

template <typename Fn>
int guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const StopRequested& e) {
        std::cerr << e.what() << std::endl;
        return kExitCancelled;
    } catch (const ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return kExitInvalid;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return kExitInvalid;
    } catch (const IOError& e) {
        std::cerr << e.what() << std::endl;
        if (runner::message_indicates_disk_full(e.what())) {
            std::cerr << "Output device is full; free space and re-run." << std::endl;
        }
        return kExitIO;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailedRun;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Panel Promote: grid slicing, cropping and refinement payloads"};
    app.require_subcommand(1);

    std::string plan_path, config_path, backend, log_path, panel_id, image_path, out_path;
    int workers = 0;
    long long global_seed = 0;

    auto run_cmd = app.add_subcommand("run", "Promote the panels of a plan");
    run_cmd->add_option("--plan", plan_path, "Path to promotion plan JSON")->required();
    run_cmd->add_option("--config", config_path, "Path to config.yaml");
    run_cmd->add_option("--workers", workers, "Parallel workers (0 = from config)");
    run_cmd->add_option("--backend", backend, "Payload schema: comfyui|automatic1111");
    run_cmd->add_option("--log-file", log_path, "Also write JSON-lines events to this file");

    auto validate_cmd = app.add_subcommand("validate-plan", "Check a plan without writing files");
    validate_cmd->add_option("--plan", plan_path, "Path to promotion plan JSON")->required();

    auto seed_cmd = app.add_subcommand("derive-seed", "Print the seed for one panel");
    seed_cmd->add_option("--global-seed", global_seed, "Global seed")->required();
    seed_cmd->add_option("--panel-id", panel_id, "Panel id")->required();

    auto score_cmd = app.add_subcommand("score", "Score the sharpness of an image");
    score_cmd->add_option("--image", image_path, "Image path")->required();
    score_cmd->add_option("--config", config_path, "Path to config.yaml");

    auto default_cmd = app.add_subcommand("default-config", "Print or write the default config");
    default_cmd->add_option("--out", out_path, "Write to this path instead of stdout");

    auto schema_cmd = app.add_subcommand("config-schema", "Print the config JSON schema");

    CLI11_PARSE(app, argc, argv);

    if (run_cmd->parsed()) {
        return guarded([&] { return run_command(plan_path, config_path, workers, backend, log_path); });
    }
    if (validate_cmd->parsed()) {
        return guarded([&] { return validate_plan_command(plan_path); });
    }
    if (seed_cmd->parsed()) {
        return guarded([&] { return derive_seed_command(global_seed, panel_id); });
    }
    if (score_cmd->parsed()) {
        return guarded([&] { return score_command(image_path, config_path); });
    }
    if (default_cmd->parsed()) {
        return guarded([&] { return default_config_command(out_path); });
    }
    if (schema_cmd->parsed()) {
        std::cout << config::get_schema_json() << std::endl;
        return kExitOk;
    }

    std::cout << app.help() << std::endl;
    return kExitInvalid;
}
