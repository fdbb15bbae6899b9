/// @file types.cpp
/// @brief Snapshot data model helpers

#include "snapshot/types.h"

namespace skyrca::snapshot {

std::string_view MetricKindToString(MetricKind kind) {
    switch (kind) {
        case MetricKind::kLatency: return "latency";
        case MetricKind::kErrorRate: return "error_rate";
        case MetricKind::kSuccessRate: return "success_rate";
        case MetricKind::kThroughput: return "throughput";
        case MetricKind::kUnknown: return "unknown";
    }
    return "unknown";
}

MetricKind MetricKindFromName(std::string_view metric_name) {
    if (metric_name == "service_resp_time" || metric_name == "trace_latency") {
        return MetricKind::kLatency;
    }
    if (metric_name == "service_sla") {
        return MetricKind::kSuccessRate;
    }
    if (metric_name == "service_cpm") {
        return MetricKind::kThroughput;
    }
    if (metric_name.find("error") != std::string_view::npos) {
        return MetricKind::kErrorRate;
    }
    return MetricKind::kUnknown;
}

int64_t ToEpochMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

Timestamp FromEpochMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

}  // namespace skyrca::snapshot
