/// @file pipeline_config.cpp
/// @brief YAML to typed pipeline configuration

#include "pipeline/pipeline_config.h"

#include <chrono>
#include <cmath>
#include <string_view>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace skyrca::pipeline {

namespace {

absl::Status ReadDouble(const Config& config, std::string_view key, double& out) {
    SKYRCA_ASSIGN_OR_RETURN(auto value, config.GetStrictDouble(key));
    if (value) {
        out = *value;
    }
    return absl::OkStatus();
}

absl::Status ReadCount(const Config& config, std::string_view key, size_t& out) {
    SKYRCA_ASSIGN_OR_RETURN(auto value, config.GetStrictDouble(key));
    if (!value) {
        return absl::OkStatus();
    }
    if (*value < 0.0 || std::floor(*value) != *value) {
        return ConfigurationError(absl::StrCat(
            "Configuration key '", std::string(key), "' must be a non-negative integer, got ", *value));
    }
    out = static_cast<size_t>(*value);
    return absl::OkStatus();
}

absl::Status ReadMinutes(const Config& config, std::string_view key, std::chrono::minutes& out) {
    SKYRCA_ASSIGN_OR_RETURN(auto value, config.GetStrictDouble(key));
    if (!value) {
        return absl::OkStatus();
    }
    if (std::floor(*value) != *value) {
        return ConfigurationError(absl::StrCat(
            "Configuration key '", std::string(key), "' must be a whole number of minutes, got ", *value));
    }
    out = std::chrono::minutes(static_cast<int64_t>(*value));
    return absl::OkStatus();
}

absl::Status ReadDetectorConfig(const Config& config, detector::AnomalyDetectorConfig& out) {
    // Both the original key and the unit-suffixed one are accepted
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.response_time_threshold",
                                      out.response_time_threshold_ms));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.response_time_threshold_ms",
                                      out.response_time_threshold_ms));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.error_rate_threshold",
                                      out.error_rate_threshold));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.throughput_drop_threshold",
                                      out.throughput_drop_threshold));
    SKYRCA_RETURN_IF_ERROR(ReadMinutes(config, "anomaly_detection.time_window", out.time_window));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.z_score_threshold",
                                      out.z_score_threshold));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.marginal_z_score",
                                      out.marginal_z_score));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.recent_fraction",
                                      out.recent_fraction));
    SKYRCA_RETURN_IF_ERROR(ReadCount(config, "anomaly_detection.min_baseline_samples",
                                     out.min_baseline_samples));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "anomaly_detection.throughput_cv_threshold",
                                      out.throughput_cv_threshold));
    SKYRCA_RETURN_IF_ERROR(ReadMinutes(config, "anomaly_detection.trace_bucket", out.trace_bucket));
    SKYRCA_RETURN_IF_ERROR(ReadCount(config, "anomaly_detection.worker_threads",
                                     out.worker_threads));

    if (config.HasKey("anomaly_detection.algorithms")) {
        auto names = config.GetStringList("anomaly_detection.algorithms");
        if (names.empty()) {
            return ConfigurationError(
                "anomaly_detection.algorithms must be a non-empty list of algorithm names");
        }
        SKYRCA_ASSIGN_OR_RETURN(out.algorithms, detector::ParseDetectionAlgorithms(names));
    }
    return absl::OkStatus();
}

absl::Status ReadAnalyzerConfig(const Config& config, rca::RootCauseAnalyzerConfig& out) {
    SKYRCA_RETURN_IF_ERROR(ReadCount(config, "root_cause_analysis.max_depth", out.max_depth));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "root_cause_analysis.correlation_threshold",
                                      out.correlation_threshold));
    SKYRCA_RETURN_IF_ERROR(ReadMinutes(config, "root_cause_analysis.time_correlation_window",
                                       out.time_correlation_window));
    SKYRCA_RETURN_IF_ERROR(ReadDouble(config, "root_cause_analysis.propagation_decay",
                                      out.propagation_decay));
    SKYRCA_RETURN_IF_ERROR(ReadCount(config, "root_cause_analysis.impact_high_count",
                                     out.impact_high_count));
    SKYRCA_RETURN_IF_ERROR(ReadCount(config, "root_cause_analysis.impact_medium_count",
                                     out.impact_medium_count));
    SKYRCA_RETURN_IF_ERROR(ReadCount(config, "root_cause_analysis.worker_threads",
                                     out.worker_threads));
    return absl::OkStatus();
}

}  // namespace

absl::Status PipelineConfig::Validate() const {
    SKYRCA_RETURN_IF_ERROR(detector.Validate());
    SKYRCA_RETURN_IF_ERROR(analyzer.Validate());
    return absl::OkStatus();
}

absl::StatusOr<PipelineConfig> PipelineConfig::FromConfig(const Config& config) {
    PipelineConfig pipeline;

    SKYRCA_RETURN_IF_ERROR(ReadDetectorConfig(config, pipeline.detector));
    SKYRCA_RETURN_IF_ERROR(ReadAnalyzerConfig(config, pipeline.analyzer));

    pipeline.results_dir = config.GetString("output.results_dir", pipeline.results_dir);
    pipeline.enable_narrative = config.GetBool("narrative.enabled", pipeline.enable_narrative);

    if (config.HasKey("logging.level")) {
        pipeline.logging.level = ParseLogLevel(config.GetString("logging.level"),
                                               pipeline.logging.level);
    }
    if (config.HasKey("logging.file")) {
        pipeline.logging.enable_file = true;
        pipeline.logging.file_path = config.GetString("logging.file");
    }
    pipeline.logging.pattern = config.GetString("logging.pattern", pipeline.logging.pattern);

    SKYRCA_RETURN_IF_ERROR(pipeline.Validate());
    return pipeline;
}

}  // namespace skyrca::pipeline
