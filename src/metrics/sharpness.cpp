#include "panel_promote/metrics/sharpness.hpp"
#include "panel_promote/core/errors.hpp"

#include <opencv2/opencv.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace panel_promote::metrics {

namespace {

// Thresholds are calibrated on 8-bit intensities, so every depth is mapped
// onto 0..255 before the Laplacian: float images are taken as 0..1.
cv::Mat to_gray_255(const cv::Mat& img) {
    cv::Mat gray;
    switch (img.channels()) {
        case 1: gray = img; break;
        case 3: cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw PanelError("unsupported channel count " + std::to_string(img.channels()));
    }

    double scale = 1.0;
    switch (gray.depth()) {
        case CV_8U: scale = 1.0; break;
        case CV_16U: scale = 255.0 / 65535.0; break;
        case CV_32F:
        case CV_64F: scale = 255.0; break;
        default:
            throw PanelError("unsupported pixel depth for sharpness scoring");
    }

    cv::Mat out;
    gray.convertTo(out, CV_64F, scale);
    return out;
}

std::string fmt(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

} // namespace

double score_sharpness(const cv::Mat& img) {
    if (img.empty()) {
        throw PanelError("cannot score an empty image");
    }
    cv::Mat gray = to_gray_255(img);

    // ksize=1 is the 3x3 four-neighbour kernel [0 1 0; 1 -4 1; 0 1 0]
    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F, 1);

    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(lap, mean, stddev);
    return stddev[0] * stddev[0];
}

QualityTier classify_sharpness(double score, const config::QAConfig& qa) {
    if (score < qa.too_soft_below) return QualityTier::TOO_SOFT;
    if (score < qa.good_from) return QualityTier::ACCEPTABLE;
    if (score < qa.oversharpen_from) return QualityTier::GOOD;
    return QualityTier::OVERSHARPEN_RISK;
}

std::vector<std::string> panel_quality_warnings(double score, const config::QAConfig& qa) {
    std::vector<std::string> out;
    if (score < qa.good_from) {
        out.push_back("soft: sharpness " + fmt(score) + " below " + fmt(qa.good_from));
    }
    if (score > qa.oversharpen_from) {
        out.push_back("oversharpen risk: sharpness " + fmt(score) + " above " +
                      fmt(qa.oversharpen_from));
    }
    return out;
}

double aspect_deviation(double ratio, double target_ratio) {
    return std::fabs(ratio - target_ratio) / target_ratio;
}

AggregateStats compute_aggregate_stats(const std::vector<double>& scores) {
    AggregateStats s;
    if (scores.empty()) return s;

    Eigen::Map<const VectorXd> v(scores.data(), static_cast<Eigen::Index>(scores.size()));
    s.scored_panels = static_cast<int>(scores.size());
    s.mean_sharpness = v.mean();
    s.min_sharpness = v.minCoeff();
    s.max_sharpness = v.maxCoeff();
    // population std (divide by N)
    s.std_sharpness = std::sqrt((v.array() - s.mean_sharpness).square().mean());
    return s;
}

QAReport evaluate_run(const std::vector<PanelResult>& panels, double target_ratio,
                      const config::QAConfig& qa) {
    QAReport report;
    report.panels_total = static_cast<int>(panels.size());

    std::vector<double> scores;
    scores.reserve(panels.size());
    for (const auto& p : panels) {
        if (p.succeeded()) {
            scores.push_back(p.sharpness_score);
        } else {
            ++report.panels_failed;
        }
    }
    report.aggregate_stats = compute_aggregate_stats(scores);

    // Failed panels are excluded from the aggregate; they only warn when
    // something else succeeded, otherwise the run fails outright.
    if (scores.empty()) {
        report.fail_reasons.push_back("no panel completed processing");
    } else if (report.aggregate_stats.mean_sharpness < qa.mean_sharpness_floor) {
        report.fail_reasons.push_back("mean sharpness " + fmt(report.aggregate_stats.mean_sharpness) +
                                      " below floor " + fmt(qa.mean_sharpness_floor));
    }

    for (const auto& p : panels) {
        if (!p.succeeded()) {
            if (!scores.empty()) {
                report.warnings.push_back(p.panel_id + ": failed (" + p.error + ")");
            }
            continue;
        }
        const double dev = aspect_deviation(p.aspect_ratio, target_ratio);
        if (dev > qa.aspect_fail_deviation) {
            report.fail_reasons.push_back(p.panel_id + ": aspect ratio " + fmt(p.aspect_ratio) +
                                          " deviates " + fmt(dev * 100.0) + "% from target " +
                                          fmt(target_ratio));
        }
        // Only quality bands count toward REVIEW_NEEDED; notes such as padding
        // stay on the panel's own entry.
        for (const auto& w : panel_quality_warnings(p.sharpness_score, qa)) {
            report.warnings.push_back(p.panel_id + ": " + w);
        }
    }

    if (!report.fail_reasons.empty()) {
        report.validation_status = ValidationStatus::FAILED;
    } else if (!report.warnings.empty()) {
        report.validation_status = ValidationStatus::REVIEW_NEEDED;
    } else {
        report.validation_status = ValidationStatus::PASSED;
    }
    return report;
}

} // namespace panel_promote::metrics
