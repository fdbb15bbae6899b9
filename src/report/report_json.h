#pragma once

/// @file report_json.h
/// @brief JSON encoding of detection results and root-cause reports
///
/// Timestamps are encoded as milliseconds since the Unix epoch. Decoding
/// reproduces every numeric field exactly.

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "detector/anomaly.h"
#include "rca/root_cause.h"

namespace skyrca::report {

nlohmann::json AnomalyToJson(const detector::Anomaly& anomaly);
absl::StatusOr<detector::Anomaly> AnomalyFromJson(const nlohmann::json& j);

/// @brief {anomalies{high_priority, medium_priority, low_priority},
///         detection_timestamp, metrics_summary, diagnostics}
nlohmann::json DetectionResultToJson(const detector::DetectionResult& result);
absl::StatusOr<detector::DetectionResult> DetectionResultFromJson(const nlohmann::json& j);

/// @brief {analysis_timestamp, service_graph_stats, root_causes[], diagnostics}
nlohmann::json RootCauseReportToJson(const rca::RootCauseReport& report);
absl::StatusOr<rca::RootCauseReport> RootCauseReportFromJson(const nlohmann::json& j);

}  // namespace skyrca::report
