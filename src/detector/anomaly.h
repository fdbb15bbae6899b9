#pragma once

/// @file anomaly.h
/// @brief Anomaly records and the prioritized detection result

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "snapshot/types.h"

namespace skyrca::detector {

/// @brief Classified symptom kind
enum class AnomalyKind {
    kLatencySpike,
    kErrorRateSpike,
    kThroughputDrop,
    kThroughputUnstable
};

/// @brief Priority tier of an anomaly
enum class Priority {
    kHigh,
    kMedium,
    kLow
};

std::string_view AnomalyKindToString(AnomalyKind kind);
std::optional<AnomalyKind> AnomalyKindFromString(std::string_view name);

std::string_view PriorityToString(Priority priority);
std::optional<Priority> PriorityFromString(std::string_view name);

/// @brief Ranking weight of a priority tier (high 3, medium 2, low 1)
double PriorityWeight(Priority priority);

/// @brief A detected abnormal behavior of one service metric
struct Anomaly {
    std::string service_id;
    std::string service_name;
    std::string metric_name;
    AnomalyKind kind = AnomalyKind::kLatencySpike;
    Priority priority = Priority::kLow;

    double observed_value = 0.0;   ///< Mean of the recent samples
    double baseline_value = 0.0;   ///< Mean of the earlier samples
    double threshold = 0.0;        ///< Limit the observed value was compared against
    double deviation = 0.0;        ///< Direction-aware z-score (coefficient of variation for instability)

    bool threshold_violated = false;
    bool statistical_violated = false;

    snapshot::Timestamp timestamp;
    std::string description;
};

/// @brief Anomalies grouped into priority buckets, each in detection order
struct AnomalySet {
    std::vector<Anomaly> high;
    std::vector<Anomaly> medium;
    std::vector<Anomaly> low;

    /// @brief Append to the bucket matching the anomaly's priority
    void Add(Anomaly anomaly);

    const std::vector<Anomaly>& Bucket(Priority priority) const;

    size_t Size() const { return high.size() + medium.size() + low.size(); }
    bool Empty() const { return Size() == 0; }

    /// @brief All anomalies, high bucket first
    std::vector<Anomaly> Flatten() const;
};

/// @brief Per-pass service counts
struct MetricsSummary {
    size_t total_services = 0;
    size_t services_with_anomalies = 0;
};

/// @brief Output of one detection pass
struct DetectionResult {
    AnomalySet anomalies;
    snapshot::Timestamp detection_timestamp;
    MetricsSummary metrics_summary;

    /// Data-quality problems recovered from during the pass
    std::vector<std::string> diagnostics;
};

}  // namespace skyrca::detector
