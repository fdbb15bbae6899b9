/// @file anomaly.cpp
/// @brief Anomaly enum conversions and bucket helpers

#include "detector/anomaly.h"

namespace skyrca::detector {

std::string_view AnomalyKindToString(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::kLatencySpike: return "latency_spike";
        case AnomalyKind::kErrorRateSpike: return "error_rate_spike";
        case AnomalyKind::kThroughputDrop: return "throughput_drop";
        case AnomalyKind::kThroughputUnstable: return "throughput_unstable";
    }
    return "unknown";
}

std::optional<AnomalyKind> AnomalyKindFromString(std::string_view name) {
    if (name == "latency_spike") return AnomalyKind::kLatencySpike;
    if (name == "error_rate_spike") return AnomalyKind::kErrorRateSpike;
    if (name == "throughput_drop") return AnomalyKind::kThroughputDrop;
    if (name == "throughput_unstable") return AnomalyKind::kThroughputUnstable;
    return std::nullopt;
}

std::string_view PriorityToString(Priority priority) {
    switch (priority) {
        case Priority::kHigh: return "high";
        case Priority::kMedium: return "medium";
        case Priority::kLow: return "low";
    }
    return "unknown";
}

std::optional<Priority> PriorityFromString(std::string_view name) {
    if (name == "high") return Priority::kHigh;
    if (name == "medium") return Priority::kMedium;
    if (name == "low") return Priority::kLow;
    return std::nullopt;
}

double PriorityWeight(Priority priority) {
    switch (priority) {
        case Priority::kHigh: return 3.0;
        case Priority::kMedium: return 2.0;
        case Priority::kLow: return 1.0;
    }
    return 0.0;
}

void AnomalySet::Add(Anomaly anomaly) {
    switch (anomaly.priority) {
        case Priority::kHigh:
            high.push_back(std::move(anomaly));
            break;
        case Priority::kMedium:
            medium.push_back(std::move(anomaly));
            break;
        case Priority::kLow:
            low.push_back(std::move(anomaly));
            break;
    }
}

const std::vector<Anomaly>& AnomalySet::Bucket(Priority priority) const {
    switch (priority) {
        case Priority::kHigh: return high;
        case Priority::kMedium: return medium;
        case Priority::kLow: return low;
    }
    return low;
}

std::vector<Anomaly> AnomalySet::Flatten() const {
    std::vector<Anomaly> all;
    all.reserve(Size());
    all.insert(all.end(), high.begin(), high.end());
    all.insert(all.end(), medium.begin(), medium.end());
    all.insert(all.end(), low.begin(), low.end());
    return all;
}

}  // namespace skyrca::detector
