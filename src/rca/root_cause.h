#pragma once

/// @file root_cause.h
/// @brief Root-cause candidates and the ranked report

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "detector/anomaly.h"
#include "graph/service_graph.h"
#include "snapshot/types.h"

namespace skyrca::rca {

/// @brief How widely a root cause spreads downstream
enum class ImpactSeverity {
    kHigh,
    kMedium,
    kLow
};

std::string_view ImpactSeverityToString(ImpactSeverity severity);
std::optional<ImpactSeverity> ImpactSeverityFromString(std::string_view name);

/// @brief A downstream service showing symptoms of the candidate
struct AffectedService {
    std::string service_id;
    size_t distance = 0;                ///< Hops from the candidate
    size_t anomaly_count = 0;
    double mean_priority_weight = 0.0;
};

/// @brief Downstream impact of a candidate
struct ImpactAnalysis {
    std::vector<AffectedService> affected_services;
    ImpactSeverity impact_severity = ImpactSeverity::kLow;
};

/// @brief A service ranked as a possible origin of the observed anomalies
struct RootCauseCandidate {
    std::string root_service;           ///< Graph node id
    std::string root_service_name;
    double root_cause_score = 0.0;
    double confidence = 0.0;            ///< 0.0 - 1.0
    double criticality_score = 0.0;     ///< Graph-position weight, 0.0 - 1.0
    std::vector<detector::Anomaly> anomalies;
    ImpactAnalysis impact_analysis;
    std::vector<std::string> upstream_services;    ///< Immediate callers
    std::vector<std::string> downstream_services;  ///< Reachable callees within max_depth
    std::string recommendation;
};

/// @brief Output of one analysis pass, candidates sorted by descending score
struct RootCauseReport {
    snapshot::Timestamp analysis_timestamp;
    graph::GraphStats service_graph_stats;
    std::vector<RootCauseCandidate> root_causes;

    /// Anomalous services that mapped onto the graph (0 means nothing to analyze)
    size_t services_analyzed = 0;

    std::vector<std::string> diagnostics;
};

}  // namespace skyrca::rca
