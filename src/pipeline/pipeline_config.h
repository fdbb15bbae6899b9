#pragma once

/// @file pipeline_config.h
/// @brief Typed configuration of an analysis run, loaded from YAML

#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "detector/anomaly_detector.h"
#include "rca/root_cause_analyzer.h"

namespace skyrca::pipeline {

/// @brief Configuration of one analysis pipeline
///
/// YAML layout:
/// @code
///   anomaly_detection:
///     response_time_threshold: 1000    # ms
///     error_rate_threshold: 5.0        # percent
///     throughput_drop_threshold: 30    # percent
///     time_window: 60                  # minutes
///     algorithms: [threshold, z_score, variability]
///   root_cause_analysis:
///     max_depth: 5
///     correlation_threshold: 0.7
///     time_correlation_window: 5       # minutes
///   output:
///     results_dir: ./results
///   narrative:
///     enabled: true
///   logging:
///     level: info
///     file: skyrca.log
/// @endcode
struct PipelineConfig {
    detector::AnomalyDetectorConfig detector;
    rca::RootCauseAnalyzerConfig analyzer;

    /// Run the narrative annotator (when one is attached)
    bool enable_narrative = true;

    /// Directory the JSON result sink writes into
    std::string results_dir = "./results";

    LogConfig logging;

    /// @brief Validate both component configurations
    absl::Status Validate() const;

    /// @brief Map a loaded configuration onto typed settings
    /// @return Validated configuration, or InvalidArgument naming the bad key
    static absl::StatusOr<PipelineConfig> FromConfig(const Config& config);
};

}  // namespace skyrca::pipeline
