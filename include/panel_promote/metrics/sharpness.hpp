#pragma once

#include "panel_promote/config/configuration.hpp"
#include "panel_promote/core/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace panel_promote::metrics {

// Variance of the 4-neighbour Laplacian of the grayscale image, on a 0..255
// intensity scale. Higher means more edge energy.
double score_sharpness(const cv::Mat& img);

QualityTier classify_sharpness(double score, const config::QAConfig& qa);

// Non-blocking findings for one scored panel (soft or oversharpen band).
std::vector<std::string> panel_quality_warnings(double score, const config::QAConfig& qa);

// |ratio - target| / target
double aspect_deviation(double ratio, double target_ratio);

AggregateStats compute_aggregate_stats(const std::vector<double>& scores);

// Applies the run-level fail/warn policy to the processed panels.
QAReport evaluate_run(const std::vector<PanelResult>& panels, double target_ratio,
                      const config::QAConfig& qa);

} // namespace panel_promote::metrics
