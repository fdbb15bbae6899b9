#pragma once

/// @file anomaly_detector.h
/// @brief Rule-based and statistical anomaly detection over service metrics
///
/// Every (service, metric) series is split into a baseline (earlier samples)
/// and a recent segment. The recent mean is checked against fixed limits
/// (threshold rule) and against the baseline distribution (z-score rule);
/// the combination decides the priority tier. Throughput series are also
/// checked for instability via their coefficient of variation.

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detector/anomaly.h"
#include "graph/service_graph.h"
#include "snapshot/types.h"

namespace skyrca::detector {

/// @brief Detection rule families
enum class DetectionAlgorithm {
    kThreshold,    ///< Fixed limits ("threshold", also "statistical")
    kZScore,       ///< Baseline z-score ("z_score")
    kVariability   ///< Throughput coefficient of variation ("variability")
};

std::string_view DetectionAlgorithmToString(DetectionAlgorithm algorithm);

/// @brief Parse configured algorithm names
///
/// "isolation_forest" is accepted and skipped with a warning; any other
/// unknown name is a configuration error.
absl::StatusOr<std::vector<DetectionAlgorithm>> ParseDetectionAlgorithms(
    const std::vector<std::string>& names);

/// @brief Configuration for anomaly detection
struct AnomalyDetectorConfig {
    /// Latency limit in milliseconds
    double response_time_threshold_ms = 1000.0;

    /// Error rate limit in percent
    double error_rate_threshold = 5.0;

    /// Throughput drop, in percent of the baseline, that counts as a violation
    double throughput_drop_threshold = 30.0;

    /// Only samples this close to the latest sample of a series are used
    std::chrono::minutes time_window{60};

    /// Enabled rule families
    std::vector<DetectionAlgorithm> algorithms = {
        DetectionAlgorithm::kThreshold,
        DetectionAlgorithm::kZScore,
        DetectionAlgorithm::kVariability
    };

    /// |z| at or above this fires the statistical rule
    double z_score_threshold = 3.0;

    /// |z| at or above this (but below z_score_threshold) is a marginal signal
    double marginal_z_score = 2.0;

    /// Share of the newest samples that forms the recent segment
    double recent_fraction = 0.25;

    /// Baseline samples required before the z-score rule applies
    size_t min_baseline_samples = 3;

    /// Throughput coefficient of variation above this is unstable
    double throughput_cv_threshold = 0.5;

    /// Width of the buckets traces are aggregated into
    std::chrono::minutes trace_bucket{1};

    /// Services evaluated in parallel (1 = sequential)
    size_t worker_threads = 1;

    /// @brief Reject out-of-range values
    absl::Status Validate() const;

    bool IsEnabled(DetectionAlgorithm algorithm) const;
};

/// @brief Aggregate traces into per-bucket latency and error-rate series
///
/// Returns "trace_error_rate" and "trace_latency" series (in that order), or
/// nothing when there are no traces. Buckets without traces are omitted.
/// A negative or non-finite duration marks the latency series malformed.
std::vector<snapshot::MetricSeries> BuildTraceSeries(
    const std::vector<snapshot::TraceRecord>& traces,
    std::chrono::minutes bucket);

/// @brief Detects abnormal service behavior in a snapshot
///
/// Example:
/// @code
///   AnomalyDetectorConfig config;
///   config.error_rate_threshold = 2.0;
///   AnomalyDetector detector(config);
///   auto graph = graph::ServiceGraph::FromTopology(snapshot.topology);
///   auto result = detector.Detect(snapshot, graph);
///   if (result.ok()) {
///       for (const auto& anomaly : result->anomalies.high) { ... }
///   }
/// @endcode
class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalyDetectorConfig config = {});
    ~AnomalyDetector();

    // Disable copy
    AnomalyDetector(const AnomalyDetector&) = delete;
    AnomalyDetector& operator=(const AnomalyDetector&) = delete;

    /// @brief Run one detection pass
    /// @param snapshot Snapshot providing the per-service series and traces
    /// @param graph Graph used to resolve service identity
    /// @return Prioritized anomalies, or InvalidArgument for a bad config
    absl::StatusOr<DetectionResult> Detect(const snapshot::Snapshot& snapshot,
                                           const graph::ServiceGraph& graph);

    const AnomalyDetectorConfig& GetConfig() const { return config_; }

    /// @brief Detection statistics across passes
    struct Stats {
        size_t passes = 0;
        size_t series_evaluated = 0;
        size_t series_malformed = 0;
        size_t anomalies_detected = 0;
    };
    Stats GetStats() const;

    /// @brief Reset statistics
    void ResetStats();

private:
    /// Identity an anomaly is reported under
    struct ServiceRef {
        std::string id;
        std::string name;
    };

    struct ServiceOutcome {
        std::vector<Anomaly> anomalies;
        std::vector<std::string> diagnostics;
        size_t series_evaluated = 0;
        size_t series_malformed = 0;
    };

    ServiceOutcome DetectService(const snapshot::ServiceMetrics& service,
                                 const graph::ServiceGraph& graph) const;

    /// @brief Evaluate one series
    /// @return Non-OK when the series is malformed; nothing is appended then
    absl::Status EvaluateSeries(const ServiceRef& service,
                                const snapshot::MetricSeries& series,
                                std::vector<Anomaly>& anomalies) const;

    std::optional<Anomaly> CheckLevel(const ServiceRef& service,
                                      const snapshot::MetricSeries& series,
                                      const std::vector<snapshot::MetricSample>& samples) const;

    std::optional<Anomaly> CheckVariability(const ServiceRef& service,
                                            const snapshot::MetricSeries& series,
                                            const std::vector<snapshot::MetricSample>& samples) const;

    AnomalyDetectorConfig config_;

    Stats stats_;
    mutable std::mutex stats_mutex_;
};

/// @brief Factory function to create an anomaly detector
std::unique_ptr<AnomalyDetector> CreateAnomalyDetector(AnomalyDetectorConfig config = {});

}  // namespace skyrca::detector
