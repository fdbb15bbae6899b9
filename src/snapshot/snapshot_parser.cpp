/// @file snapshot_parser.cpp
/// @brief Snapshot JSON reader implementation

#include "snapshot/snapshot_parser.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "common/error.h"
#include "common/logging.h"

namespace skyrca::snapshot {

using json = nlohmann::json;

namespace {

// Epoch values above this are milliseconds (1e11 s is the year 5138)
constexpr double kMillisecondEpochCutoff = 1e11;

// Largest epoch offset whose nanosecond count still fits in int64
constexpr double kMaxEpochMillis = 9.2e15;

/// Time context used to place samples that carry no timestamp
struct TimeContext {
    std::optional<TimeRange> range;
    std::optional<Timestamp> anchor;
};

std::string GetString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

absl::StatusOr<Timestamp> FromEpochNumber(double value) {
    double millis = value > kMillisecondEpochCutoff ? value : value * 1000.0;
    if (!std::isfinite(millis) || std::abs(millis) > kMaxEpochMillis) {
        return MalformedSnapshotError(absl::StrCat("Epoch timestamp out of range: ", value));
    }
    return FromEpochMillis(static_cast<int64_t>(std::llround(millis)));
}

/// Timestamps are kept at millisecond precision, the resolution of the JSON output
Timestamp TruncateToMillis(Timestamp ts) {
    return FromEpochMillis(ToEpochMillis(ts));
}

/// Numbers and numeric strings; std::nullopt for anything else
std::optional<double> AsNumber(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        double parsed = 0.0;
        if (absl::SimpleAtod(value.get<std::string>(), &parsed)) {
            return parsed;
        }
    }
    return std::nullopt;
}

Timestamp SpreadTimestamp(const TimeContext& context, size_t index, size_t total) {
    if (context.range) {
        if (total <= 1) {
            return context.range->end;
        }
        auto span = context.range->end - context.range->start;
        return TruncateToMillis(context.range->start + span * static_cast<int64_t>(index) /
                                                           static_cast<int64_t>(total - 1));
    }
    auto steps_from_end = static_cast<int64_t>(total - 1 - index);
    if (context.anchor) {
        return *context.anchor - std::chrono::minutes(steps_from_end);
    }
    return Timestamp{} + std::chrono::minutes(static_cast<int64_t>(index));
}

/// Flatten both value layouts into a single list of sample items
bool CollectSampleItems(const json& entry, std::vector<const json*>& items) {
    const json* values = &entry;
    if (entry.is_object()) {
        auto it = entry.find("values");
        if (it == entry.end()) {
            return false;
        }
        values = &*it;
    }

    if (values->is_object()) {
        auto inner = values->find("values");
        if (inner == values->end() || !inner->is_array()) {
            return false;
        }
        for (const auto& item : *inner) {
            items.push_back(&item);
        }
        return true;
    }

    if (values->is_array()) {
        for (const auto& group : *values) {
            if (group.is_object() && group.contains("values") && group["values"].is_array()) {
                for (const auto& item : group["values"]) {
                    items.push_back(&item);
                }
            } else {
                items.push_back(&group);
            }
        }
        return true;
    }

    return false;
}

MetricSeries ParseMetricSeries(const std::string& name, const json& entry,
                               const TimeContext& context) {
    MetricSeries series;
    series.name = name;
    series.kind = MetricKindFromName(name);

    std::vector<const json*> items;
    if (!CollectSampleItems(entry, items)) {
        series.malformed_reason = "unrecognized metric value layout";
        return series;
    }

    for (size_t i = 0; i < items.size(); ++i) {
        const json& item = *items[i];
        const json* raw_value = &item;
        std::optional<Timestamp> ts;

        if (item.is_object()) {
            auto value_it = item.find("value");
            if (value_it == item.end()) {
                continue;
            }
            raw_value = &*value_it;

            auto ts_it = item.find("timestamp");
            if (ts_it != item.end() && !ts_it->is_null()) {
                auto parsed = ParseTimestamp(*ts_it);
                if (!parsed.ok()) {
                    series.samples.clear();
                    series.malformed_reason = std::string(parsed.status().message());
                    return series;
                }
                ts = *parsed;
            }
        }

        if (raw_value->is_null()) {
            continue;
        }

        auto value = AsNumber(*raw_value);
        if (!value) {
            series.samples.clear();
            series.malformed_reason = absl::StrCat("non-numeric sample ", raw_value->dump());
            return series;
        }

        MetricSample sample;
        sample.timestamp = ts ? *ts : SpreadTimestamp(context, i, items.size());
        sample.value = *value;
        series.samples.push_back(sample);
    }

    std::stable_sort(series.samples.begin(), series.samples.end(),
        [](const MetricSample& a, const MetricSample& b) {
            return a.timestamp < b.timestamp;
        });

    return series;
}

std::optional<TraceRecord> ParseTrace(const json& j, const std::string& service,
                                      std::vector<std::string>& warnings) {
    if (!j.is_object()) {
        warnings.push_back(absl::StrCat("Service ", service, ": trace entry is not an object"));
        return std::nullopt;
    }

    TraceRecord trace;
    trace.segment_id = GetString(j, "segmentId");
    if (trace.segment_id.empty() && j.contains("traceIds") && j["traceIds"].is_array() &&
        !j["traceIds"].empty()) {
        trace.segment_id = j["traceIds"].front().is_string()
            ? j["traceIds"].front().get<std::string>()
            : j["traceIds"].front().dump();
    }

    auto duration_it = j.find("duration");
    std::optional<double> duration =
        duration_it == j.end() ? std::nullopt : AsNumber(*duration_it);
    if (!duration) {
        warnings.push_back(absl::StrCat("Service ", service, ": trace ", trace.segment_id,
                                        " has no numeric duration"));
        return std::nullopt;
    }
    trace.duration_ms = *duration;

    auto start_it = j.find("start");
    if (start_it == j.end() || start_it->is_null()) {
        warnings.push_back(absl::StrCat("Service ", service, ": trace ", trace.segment_id,
                                        " has no start time"));
        return std::nullopt;
    }
    auto start = ParseTimestamp(*start_it);
    if (!start.ok()) {
        warnings.push_back(absl::StrCat("Service ", service, ": trace ", trace.segment_id, ": ",
                                        start.status().message()));
        return std::nullopt;
    }
    trace.start = *start;

    auto error_it = j.find("isError");
    trace.is_error = error_it != j.end() && error_it->is_boolean() && error_it->get<bool>();
    return trace;
}

absl::Status ParseTopology(const json& j, Topology& topology, std::vector<std::string>& warnings) {
    if (!j.is_object()) {
        return MalformedSnapshotError("'topology' must be an object");
    }

    if (j.contains("nodes")) {
        if (!j["nodes"].is_array()) {
            return MalformedSnapshotError("'topology.nodes' must be an array");
        }
        for (const auto& node_json : j["nodes"]) {
            if (!node_json.is_object()) {
                warnings.push_back("Topology node entry is not an object");
                continue;
            }
            ServiceNode node;
            node.id = GetString(node_json, "id");
            node.name = GetString(node_json, "name");
            node.type = GetString(node_json, "type");
            if (node.id.empty()) {
                node.id = node.name;
            }
            if (node.id.empty()) {
                warnings.push_back("Topology node without id or name dropped");
                continue;
            }
            auto real_it = node_json.find("isReal");
            node.is_real = real_it == node_json.end() || !real_it->is_boolean() ||
                           real_it->get<bool>();
            topology.nodes.push_back(std::move(node));
        }
    }

    if (j.contains("calls")) {
        if (!j["calls"].is_array()) {
            return MalformedSnapshotError("'topology.calls' must be an array");
        }
        for (const auto& call_json : j["calls"]) {
            if (!call_json.is_object()) {
                warnings.push_back("Topology call entry is not an object");
                continue;
            }
            CallEdge edge;
            edge.source = GetString(call_json, "source");
            edge.target = GetString(call_json, "target");
            if (edge.source.empty() || edge.target.empty()) {
                warnings.push_back("Topology call without source or target dropped");
                continue;
            }
            topology.calls.push_back(std::move(edge));
        }
    }

    return absl::OkStatus();
}

std::optional<ServiceMetrics> ParseService(const json& j, const TimeContext& context,
                                           std::vector<std::string>& warnings) {
    if (!j.is_object()) {
        warnings.push_back("Service entry is not an object");
        return std::nullopt;
    }

    ServiceMetrics service;
    const json& identity = j.contains("service") && j["service"].is_object() ? j["service"] : j;
    service.service_id = GetString(identity, "id");
    service.service_name = GetString(identity, "name");
    if (service.service_id.empty() && service.service_name.empty()) {
        warnings.push_back("Service entry without id or name dropped");
        return std::nullopt;
    }
    const std::string& key = service.Key();

    auto metrics_it = j.find("metrics");
    if (metrics_it != j.end() && !metrics_it->is_null()) {
        if (metrics_it->is_object()) {
            for (const auto& [name, entry] : metrics_it->items()) {
                service.metrics.emplace(name, ParseMetricSeries(name, entry, context));
            }
        } else {
            warnings.push_back(absl::StrCat("Service ", key, ": 'metrics' is not an object"));
        }
    }

    auto traces_it = j.find("traces");
    if (traces_it != j.end() && !traces_it->is_null()) {
        if (traces_it->is_array()) {
            for (const auto& trace_json : *traces_it) {
                if (auto trace = ParseTrace(trace_json, key, warnings)) {
                    service.traces.push_back(std::move(*trace));
                }
            }
        } else {
            warnings.push_back(absl::StrCat("Service ", key, ": 'traces' is not an array"));
        }
    }

    auto instances_it = j.find("instances");
    if (instances_it != j.end() && instances_it->is_array()) {
        for (const auto& instance_json : *instances_it) {
            if (!instance_json.is_object()) {
                continue;
            }
            ServiceInstance instance;
            instance.id = GetString(instance_json, "id");
            instance.name = GetString(instance_json, "name");
            service.instances.push_back(std::move(instance));
        }
    }

    return service;
}

/// Latest sample or trace time across the whole snapshot
std::optional<Timestamp> LatestObservation(const Snapshot& snapshot) {
    std::optional<Timestamp> latest;
    auto observe = [&latest](Timestamp ts) {
        if (!latest || ts > *latest) {
            latest = ts;
        }
    };
    for (const auto& service : snapshot.services) {
        for (const auto& [name, series] : service.metrics) {
            if (!series.samples.empty()) {
                observe(series.samples.back().timestamp);
            }
        }
        for (const auto& trace : service.traces) {
            observe(trace.start);
        }
    }
    return latest;
}

}  // namespace

absl::StatusOr<Timestamp> ParseTimestamp(const json& value) {
    if (value.is_number()) {
        return FromEpochNumber(value.get<double>());
    }
    if (!value.is_string()) {
        return MalformedSnapshotError(
            absl::StrCat("Unsupported timestamp value ", value.dump()));
    }

    const std::string text = value.get<std::string>();
    double numeric = 0.0;
    if (absl::SimpleAtod(text, &numeric)) {
        return FromEpochNumber(numeric);
    }

    static const char* const kFormats[] = {
        "%Y-%m-%d%ET%H:%M:%E*S%Ez",  // RFC 3339 with offset
        "%Y-%m-%d%ET%H:%M:%E*S",     // naive ISO 8601, UTC
        "%Y-%m-%d %H:%M:%E*S",
        "%Y-%m-%d %H%M",             // SkyWalking minute step
    };
    for (const char* format : kFormats) {
        absl::Time parsed;
        std::string error;
        if (absl::ParseTime(format, text, absl::UTCTimeZone(), &parsed, &error)) {
            return TruncateToMillis(absl::ToChronoTime(parsed));
        }
    }

    return MalformedSnapshotError(absl::StrCat("Unparseable timestamp '", text, "'"));
}

absl::StatusOr<Snapshot> ParseSnapshot(const json& document) {
    if (!document.is_object()) {
        return MalformedSnapshotError("Snapshot document must be a JSON object");
    }

    Snapshot snapshot;
    TimeContext context;

    try {
        auto range_it = document.find("time_range");
        if (range_it != document.end() && range_it->is_object() &&
            range_it->contains("start") && range_it->contains("end")) {
            auto start = ParseTimestamp((*range_it)["start"]);
            auto end = ParseTimestamp((*range_it)["end"]);
            if (start.ok() && end.ok() && *start <= *end) {
                snapshot.time_range = TimeRange{*start, *end};
            } else {
                snapshot.warnings.push_back("Ignoring unusable 'time_range'");
            }
        }

        std::optional<Timestamp> explicit_timestamp;
        auto ts_it = document.find("timestamp");
        if (ts_it != document.end() && !ts_it->is_null()) {
            SKYRCA_ASSIGN_OR_RETURN(Timestamp ts, ParseTimestamp(*ts_it));
            explicit_timestamp = ts;
        }

        context.range = snapshot.time_range;
        context.anchor = explicit_timestamp;

        auto topology_it = document.find("topology");
        if (topology_it != document.end() && !topology_it->is_null()) {
            SKYRCA_RETURN_IF_ERROR(ParseTopology(*topology_it, snapshot.topology, snapshot.warnings));
        }

        auto services_it = document.find("services");
        if (services_it != document.end() && !services_it->is_null()) {
            if (!services_it->is_array()) {
                return MalformedSnapshotError("'services' must be an array");
            }
            for (const auto& service_json : *services_it) {
                if (auto service = ParseService(service_json, context, snapshot.warnings)) {
                    snapshot.services.push_back(std::move(*service));
                }
            }
        }

        if (explicit_timestamp) {
            snapshot.timestamp = *explicit_timestamp;
        } else if (snapshot.time_range) {
            snapshot.timestamp = snapshot.time_range->end;
        } else if (auto latest = LatestObservation(snapshot)) {
            snapshot.timestamp = *latest;
        }
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Failed to read snapshot: ", e.what()));
    }

    for (const auto& warning : snapshot.warnings) {
        SKYRCA_LOG_WARN("Snapshot: {}", warning);
    }
    SKYRCA_LOG_DEBUG("Parsed snapshot with {} nodes, {} calls, {} services",
                     snapshot.topology.nodes.size(), snapshot.topology.calls.size(),
                     snapshot.services.size());

    return snapshot;
}

absl::StatusOr<Snapshot> ParseSnapshotString(std::string_view content) {
    json document;
    try {
        document = json::parse(content);
    } catch (const json::parse_error& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Snapshot is not valid JSON: ", e.what()));
    }
    return ParseSnapshot(document);
}

}  // namespace skyrca::snapshot
