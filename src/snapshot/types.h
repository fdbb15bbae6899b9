#pragma once

/// @file types.h
/// @brief Snapshot data model: topology, metric series and traces of one capture

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skyrca::snapshot {

using Timestamp = std::chrono::system_clock::time_point;

/// @brief Semantic kind of a metric series, resolved from its name
enum class MetricKind {
    kLatency,      ///< Response time in milliseconds
    kErrorRate,    ///< Error percentage (0 - 100)
    kSuccessRate,  ///< SLA / success percentage (0 - 100, or basis points)
    kThroughput,   ///< Calls per minute
    kUnknown
};

/// @brief Convert metric kind to string
std::string_view MetricKindToString(MetricKind kind);

/// @brief Resolve the kind of a reported metric from its name
///
/// service_resp_time -> latency, service_sla -> success rate,
/// service_cpm -> throughput, anything containing "error" -> error rate.
MetricKind MetricKindFromName(std::string_view metric_name);

/// @brief A service vertex of the call topology
struct ServiceNode {
    std::string id;
    std::string name;
    std::string type;
    bool is_real = true;
};

/// @brief A directed call from source to target
struct CallEdge {
    std::string source;
    std::string target;
};

/// @brief Call topology of one snapshot
struct Topology {
    std::vector<ServiceNode> nodes;
    std::vector<CallEdge> calls;
};

/// @brief A single time-series sample
struct MetricSample {
    Timestamp timestamp;
    double value = 0.0;
};

/// @brief A named, time-ordered metric series
struct MetricSeries {
    std::string name;
    MetricKind kind = MetricKind::kUnknown;
    std::vector<MetricSample> samples;

    /// Set by the parser when the wire data could not be read as numbers
    std::string malformed_reason;

    bool Empty() const { return samples.empty(); }
    bool IsMalformed() const { return !malformed_reason.empty(); }
};

/// @brief A sampled request trace segment
struct TraceRecord {
    std::string segment_id;
    double duration_ms = 0.0;
    Timestamp start;
    bool is_error = false;
};

/// @brief A running instance of a service
struct ServiceInstance {
    std::string id;
    std::string name;
};

/// @brief Everything collected for one service
struct ServiceMetrics {
    std::string service_id;
    std::string service_name;

    /// Reported series keyed by metric name (ordered for deterministic iteration)
    std::map<std::string, MetricSeries> metrics;

    std::vector<TraceRecord> traces;
    std::vector<ServiceInstance> instances;

    /// @brief Id when present, otherwise the name
    const std::string& Key() const { return service_id.empty() ? service_name : service_id; }
};

/// @brief Capture interval of a snapshot
struct TimeRange {
    Timestamp start;
    Timestamp end;
};

/// @brief One consistent capture of topology plus metrics
struct Snapshot {
    Timestamp timestamp;
    std::optional<TimeRange> time_range;
    Topology topology;
    std::vector<ServiceMetrics> services;

    /// Recoverable problems found while reading the wire format
    std::vector<std::string> warnings;
};

/// @brief Milliseconds since the Unix epoch
int64_t ToEpochMillis(Timestamp ts);

/// @brief Timestamp from milliseconds since the Unix epoch
Timestamp FromEpochMillis(int64_t millis);

}  // namespace skyrca::snapshot
