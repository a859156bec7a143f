#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace panel_promote {

namespace fs = std::filesystem;

using VectorXd = Eigen::VectorXd;

// Grid layout parsed from "CxR": columns first, rows second.
struct GridSpec {
    int cols = 0;
    int rows = 0;
};

// Panel address inside the grid: row first, column second (0-based, top-left origin).
struct GridPosition {
    int row = 0;
    int col = 0;
};

inline bool operator==(const GridPosition& a, const GridPosition& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator<(const GridPosition& a, const GridPosition& b) {
    return a.row != b.row ? a.row < b.row : a.col < b.col;
}

struct ImageSize {
    int width = 0;
    int height = 0;
};

// Pixel rectangle in source image space, right/bottom exclusive.
struct PanelBounds {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
};

inline bool operator==(const PanelBounds& a, const PanelBounds& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
}

struct PanelSpec {
    std::string panel_id;
    GridPosition grid_position;
    std::string prompt_extension;
};

struct PromotionPlan {
    fs::path master_grid_path;
    fs::path output_directory;
    std::string grid_specification;
    int64_t global_seed = 0;
    std::vector<PanelSpec> panels;
    std::optional<std::string> global_style_anchor;
    std::optional<double> target_aspect_ratio;
};

enum class QualityTier {
    TOO_SOFT,
    ACCEPTABLE,
    GOOD,
    OVERSHARPEN_RISK
};

inline std::string quality_tier_to_string(QualityTier tier) {
    switch (tier) {
        case QualityTier::TOO_SOFT: return "too_soft";
        case QualityTier::ACCEPTABLE: return "acceptable";
        case QualityTier::GOOD: return "good";
        case QualityTier::OVERSHARPEN_RISK: return "oversharpen_risk";
        default: return "unknown";
    }
}

enum class ValidationStatus {
    PASSED,
    REVIEW_NEEDED,
    FAILED
};

inline std::string validation_status_to_string(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::PASSED: return "PASSED";
        case ValidationStatus::REVIEW_NEEDED: return "REVIEW_NEEDED";
        case ValidationStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

// Per-panel pipeline state
enum class PanelState {
    PENDING,
    SLICED,
    CROPPED,
    SEEDED,
    SCORED,
    PAYLOAD_BUILT,
    SKIPPED_ON_FAIL
};

inline std::string panel_state_to_string(PanelState state) {
    switch (state) {
        case PanelState::PENDING: return "PENDING";
        case PanelState::SLICED: return "SLICED";
        case PanelState::CROPPED: return "CROPPED";
        case PanelState::SEEDED: return "SEEDED";
        case PanelState::SCORED: return "SCORED";
        case PanelState::PAYLOAD_BUILT: return "PAYLOAD_BUILT";
        case PanelState::SKIPPED_ON_FAIL: return "SKIPPED_ON_FAIL";
        default: return "UNKNOWN";
    }
}

// Run-level phases
enum class Phase {
    VALIDATING_INPUT = 0,
    PROCESSING_PANELS = 1,
    AGGREGATING = 2
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::VALIDATING_INPUT: return "VALIDATING_INPUT";
        case Phase::PROCESSING_PANELS: return "PROCESSING_PANELS";
        case Phase::AGGREGATING: return "AGGREGATING";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

struct PanelResult {
    std::string panel_id;
    GridPosition grid_position;
    int panel_index = 0;              // 1-based row-major index, names output files
    PanelBounds bounds;
    ImageSize source_size;            // sliced region before padding/cropping
    ImageSize cropped_size;
    ImageSize promoted_size;
    fs::path cropped_path;            // empty unless cropped intermediates are written
    fs::path promoted_path;
    int64_t seed = 0;
    uint64_t panel_hash = 0;          // stable_hash(panel_id) mod 1'000'000
    double sharpness_score = 0.0;
    QualityTier quality_tier = QualityTier::TOO_SOFT;
    double aspect_ratio = 0.0;        // post-crop width / height
    PanelState state = PanelState::PENDING;
    PanelState last_state = PanelState::PENDING;  // last state reached before a failure
    std::vector<std::string> warnings;
    std::string error;
    nlohmann::json payload;
    std::string dispatch_handle;
    std::string dispatch_error;

    bool succeeded() const { return state == PanelState::PAYLOAD_BUILT; }
};

struct AggregateStats {
    double mean_sharpness = 0.0;
    double min_sharpness = 0.0;
    double max_sharpness = 0.0;
    double std_sharpness = 0.0;  // population standard deviation
    int scored_panels = 0;
};

struct QAReport {
    AggregateStats aggregate_stats;
    ValidationStatus validation_status = ValidationStatus::FAILED;
    std::vector<std::string> fail_reasons;
    std::vector<std::string> warnings;
    int panels_total = 0;
    int panels_failed = 0;
};

} // namespace panel_promote
