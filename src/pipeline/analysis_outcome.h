#pragma once

/// @file analysis_outcome.h
/// @brief Result of one pipeline run

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "detector/anomaly.h"
#include "pipeline/narrative_annotator.h"
#include "rca/root_cause.h"

namespace skyrca::pipeline {

/// @brief Overall verdict of a run
enum class OutcomeStatus {
    kHealthy,          ///< No anomalies detected
    kAnomaliesFound,   ///< Anomalies detected and analyzed
    kNoData            ///< Nothing could be analyzed
};

std::string_view OutcomeStatusToString(OutcomeStatus status);

/// @brief Everything a run produced
struct AnalysisOutcome {
    OutcomeStatus status = OutcomeStatus::kHealthy;
    detector::DetectionResult detection;
    rca::RootCauseReport report;
    std::optional<Narrative> narrative;

    /// Snapshot, graph, detection, analysis and collaborator problems, in pass order
    std::vector<std::string> diagnostics;
};

/// @brief Multi-line preview of a run: counts, top anomalies and top root causes
/// @param top_n Entries listed per section
std::string Summary(const AnalysisOutcome& outcome, size_t top_n = 3);

}  // namespace skyrca::pipeline
