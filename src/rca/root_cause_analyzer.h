#pragma once

/// @file root_cause_analyzer.h
/// @brief Ranks services by how likely they originated the observed anomalies
///
/// Each anomalous service starts with a local density (sum of priority
/// weights) scaled by its graph criticality. Symptoms of a service are then
/// propagated upstream along the call graph to anomalous callers, decayed
/// per hop and weighted by how close in time the symptoms are, so a caller
/// whose anomalies line up with its callees' accumulates evidence as the
/// likely origin.

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detector/anomaly.h"
#include "graph/service_graph.h"
#include "rca/root_cause.h"

namespace skyrca::rca {

/// @brief Configuration for root-cause analysis
struct RootCauseAnalyzerConfig {
    /// Traversal depth bound for propagation and impact
    size_t max_depth = 5;

    /// Minimum score to report, in units of one isolated low-priority anomaly
    double correlation_threshold = 0.7;

    /// Maximum time offset for two anomalies to be causally linked
    std::chrono::minutes time_correlation_window{5};

    /// Per-hop attenuation of propagated evidence
    double propagation_decay = 0.5;

    /// Affected downstream services needed for high / medium impact
    size_t impact_high_count = 3;
    size_t impact_medium_count = 1;

    /// Candidates scored in parallel (1 = sequential)
    size_t worker_threads = 1;

    /// @brief Reject out-of-range values
    absl::Status Validate() const;
};

/// @brief Root-cause analyzer over one detection result
///
/// Example:
/// @code
///   RootCauseAnalyzer analyzer;
///   auto report = analyzer.Analyze(detection, graph);
///   if (report.ok() && !report->root_causes.empty()) {
///       const auto& top = report->root_causes.front();
///       SKYRCA_LOG_INFO("Likely origin: {} ({:.2f})", top.root_service, top.root_cause_score);
///   }
/// @endcode
class RootCauseAnalyzer {
public:
    /// Weight of criticality components
    static constexpr double kFanInWeight = 0.6;
    static constexpr double kFanOutWeight = 0.4;

    /// Propagated contributions at or above this strength count as strong
    static constexpr double kStrongCorrelation = 0.5;

    explicit RootCauseAnalyzer(RootCauseAnalyzerConfig config = {});
    ~RootCauseAnalyzer();

    // Disable copy
    RootCauseAnalyzer(const RootCauseAnalyzer&) = delete;
    RootCauseAnalyzer& operator=(const RootCauseAnalyzer&) = delete;

    /// @brief Rank root-cause candidates
    /// @param detection Anomalies of the pass (read only)
    /// @param graph Call graph of the same snapshot (read only)
    /// @return Ranked report, or InvalidArgument for a bad config
    absl::StatusOr<RootCauseReport> Analyze(const detector::DetectionResult& detection,
                                            const graph::ServiceGraph& graph);

    /// @brief Graph-position weight of a service
    ///
    /// 0.6 * fanIn / (N - 1) + 0.4 * fanOut / (N - 1); 0 when N <= 1.
    static double CriticalityScore(const graph::ServiceGraph& graph, const std::string& id);

    const RootCauseAnalyzerConfig& GetConfig() const { return config_; }

    /// @brief Analysis statistics across passes
    struct Stats {
        size_t analyses = 0;
        size_t candidates_reported = 0;
        size_t candidates_filtered = 0;
    };
    Stats GetStats() const;

    /// @brief Reset statistics
    void ResetStats();

private:
    /// Anomalies of one service, indexed by graph node id
    using AnomalyIndex = std::map<std::string, std::vector<const detector::Anomaly*>>;

    /// Evidence one symptomatic service hands to an anomalous caller
    struct Contribution {
        std::string upstream;
        double amount = 0.0;
        bool strong = false;
    };

    std::vector<Contribution> Propagate(const std::string& service,
                                        const AnomalyIndex& index,
                                        const graph::ServiceGraph& graph) const;

    ImpactAnalysis AnalyzeImpact(const std::string& service,
                                 const graph::HopMap& downstream,
                                 const AnomalyIndex& index) const;

    RootCauseAnalyzerConfig config_;

    Stats stats_;
    mutable std::mutex stats_mutex_;
};

/// @brief Local anomaly density: sum of priority weights
double LocalDensity(const std::vector<const detector::Anomaly*>& anomalies);

/// @brief Corroboration-based confidence in [0, 1]
/// @param anomaly_count Anomalies owned by the candidate
/// @param corroborating Downstream services whose symptoms correlate in time
/// @param strong_share Share of those correlations that are strong
double ComputeConfidence(size_t anomaly_count, size_t corroborating, double strong_share);

/// @brief Human-readable next steps for a candidate
std::string BuildRecommendation(const RootCauseCandidate& candidate);

/// @brief Factory function to create a root-cause analyzer
std::unique_ptr<RootCauseAnalyzer> CreateRootCauseAnalyzer(RootCauseAnalyzerConfig config = {});

}  // namespace skyrca::rca
