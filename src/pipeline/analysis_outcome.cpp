/// @file analysis_outcome.cpp
/// @brief Outcome helpers and the textual summary

#include "pipeline/analysis_outcome.h"

#include <algorithm>
#include <sstream>

#include <absl/strings/str_format.h>
#include <absl/time/time.h>

namespace skyrca::pipeline {

std::string_view OutcomeStatusToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::kHealthy: return "healthy";
        case OutcomeStatus::kAnomaliesFound: return "anomalies_found";
        case OutcomeStatus::kNoData: return "no_data";
    }
    return "unknown";
}

std::string Summary(const AnalysisOutcome& outcome, size_t top_n) {
    const auto& detection = outcome.detection;
    const auto& anomalies = detection.anomalies;
    std::ostringstream oss;

    oss << "Analysis status: " << OutcomeStatusToString(outcome.status) << "\n";
    oss << "Detection time: "
        << absl::FormatTime("%Y-%m-%d %H:%M:%S UTC",
                            absl::FromChrono(detection.detection_timestamp),
                            absl::UTCTimeZone())
        << "\n";
    oss << "Services monitored: " << detection.metrics_summary.total_services << "\n";
    oss << "Anomalies detected: " << anomalies.Size() << "\n";
    oss << "  - high priority: " << anomalies.high.size() << "\n";
    oss << "  - medium priority: " << anomalies.medium.size() << "\n";
    oss << "  - low priority: " << anomalies.low.size() << "\n";
    oss << "Root causes identified: " << outcome.report.root_causes.size() << "\n";

    if (!anomalies.high.empty()) {
        oss << "\nHigh-priority anomalies:\n";
        size_t shown = std::min(top_n, anomalies.high.size());
        for (size_t i = 0; i < shown; ++i) {
            const auto& anomaly = anomalies.high[i];
            oss << "  " << (i + 1) << ". " << anomaly.service_name << ": "
                << detector::AnomalyKindToString(anomaly.kind)
                << " (" << anomaly.metric_name << ")\n";
        }
        if (anomalies.high.size() > shown) {
            oss << "  ... and " << (anomalies.high.size() - shown) << " more\n";
        }
    }

    const auto& root_causes = outcome.report.root_causes;
    if (!root_causes.empty()) {
        oss << "\nTop root causes:\n";
        size_t shown = std::min(top_n, root_causes.size());
        for (size_t i = 0; i < shown; ++i) {
            const auto& candidate = root_causes[i];
            oss << "  " << (i + 1) << ". "
                << absl::StrFormat("%s (score: %.2f, confidence: %.2f)",
                                   candidate.root_service_name, candidate.root_cause_score,
                                   candidate.confidence)
                << "\n";
        }
    }

    if (outcome.narrative) {
        oss << "\nNarrative sections: " << outcome.narrative->sections.size() << "\n";
    }
    if (!outcome.diagnostics.empty()) {
        oss << "\nDiagnostics: " << outcome.diagnostics.size() << "\n";
    }

    return oss.str();
}

}  // namespace skyrca::pipeline
