/// @file report_json.cpp
/// @brief JSON encoding of analysis results

#include "report/report_json.h"

#include <string>
#include <vector>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace skyrca::report {

using json = nlohmann::json;
using detector::Anomaly;

namespace {

absl::Status DecodeError(std::string_view what, const json::exception& e) {
    return MakeError(ErrorCode::kDeserializationError,
                     absl::StrCat("Failed to decode ", std::string(what), ": ", e.what()));
}

json AffectedServiceToJson(const rca::AffectedService& affected) {
    json j;
    j["service_id"] = affected.service_id;
    j["distance"] = affected.distance;
    j["anomaly_count"] = affected.anomaly_count;
    j["mean_priority_weight"] = affected.mean_priority_weight;
    return j;
}

json CandidateToJson(const rca::RootCauseCandidate& candidate) {
    json anomalies = json::array();
    for (const auto& anomaly : candidate.anomalies) {
        anomalies.push_back(AnomalyToJson(anomaly));
    }

    json affected = json::array();
    for (const auto& service : candidate.impact_analysis.affected_services) {
        affected.push_back(AffectedServiceToJson(service));
    }

    json j;
    j["root_service"] = candidate.root_service;
    j["root_service_name"] = candidate.root_service_name;
    j["root_cause_score"] = candidate.root_cause_score;
    j["confidence"] = candidate.confidence;
    j["criticality_score"] = candidate.criticality_score;
    j["anomalies"] = anomalies;
    j["impact_analysis"] = {
        {"affected_services", affected},
        {"impact_severity",
         std::string(rca::ImpactSeverityToString(candidate.impact_analysis.impact_severity))}
    };
    j["upstream_services"] = candidate.upstream_services;
    j["downstream_services"] = candidate.downstream_services;
    j["recommendation"] = candidate.recommendation;
    return j;
}

absl::StatusOr<rca::RootCauseCandidate> CandidateFromJson(const json& j) {
    rca::RootCauseCandidate candidate;
    candidate.root_service = j.at("root_service").get<std::string>();
    candidate.root_service_name = j.value("root_service_name", candidate.root_service);
    candidate.root_cause_score = j.at("root_cause_score").get<double>();
    candidate.confidence = j.at("confidence").get<double>();
    candidate.criticality_score = j.at("criticality_score").get<double>();

    for (const auto& anomaly_json : j.at("anomalies")) {
        SKYRCA_ASSIGN_OR_RETURN(Anomaly anomaly, AnomalyFromJson(anomaly_json));
        candidate.anomalies.push_back(std::move(anomaly));
    }

    const auto& impact = j.at("impact_analysis");
    for (const auto& affected_json : impact.at("affected_services")) {
        rca::AffectedService affected;
        affected.service_id = affected_json.at("service_id").get<std::string>();
        affected.distance = affected_json.at("distance").get<size_t>();
        affected.anomaly_count = affected_json.at("anomaly_count").get<size_t>();
        affected.mean_priority_weight = affected_json.at("mean_priority_weight").get<double>();
        candidate.impact_analysis.affected_services.push_back(std::move(affected));
    }
    const std::string severity = impact.at("impact_severity").get<std::string>();
    auto parsed_severity = rca::ImpactSeverityFromString(severity);
    if (!parsed_severity) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Unknown impact severity '", severity, "'"));
    }
    candidate.impact_analysis.impact_severity = *parsed_severity;

    candidate.upstream_services = j.at("upstream_services").get<std::vector<std::string>>();
    candidate.downstream_services = j.value("downstream_services", std::vector<std::string>{});
    candidate.recommendation = j.value("recommendation", "");
    return candidate;
}

std::vector<std::string> ReadDiagnostics(const json& j) {
    return j.value("diagnostics", std::vector<std::string>{});
}

}  // namespace

json AnomalyToJson(const Anomaly& anomaly) {
    json j;
    j["service_id"] = anomaly.service_id;
    j["service_name"] = anomaly.service_name;
    j["metric_name"] = anomaly.metric_name;
    j["type"] = std::string(detector::AnomalyKindToString(anomaly.kind));
    j["priority"] = std::string(detector::PriorityToString(anomaly.priority));
    j["observed_value"] = anomaly.observed_value;
    j["baseline_value"] = anomaly.baseline_value;
    j["threshold"] = anomaly.threshold;
    j["deviation"] = anomaly.deviation;
    j["threshold_violated"] = anomaly.threshold_violated;
    j["statistical_violated"] = anomaly.statistical_violated;
    j["timestamp"] = snapshot::ToEpochMillis(anomaly.timestamp);
    j["description"] = anomaly.description;
    return j;
}

absl::StatusOr<Anomaly> AnomalyFromJson(const json& j) {
    try {
        Anomaly anomaly;
        anomaly.service_id = j.at("service_id").get<std::string>();
        anomaly.service_name = j.value("service_name", anomaly.service_id);
        anomaly.metric_name = j.at("metric_name").get<std::string>();

        const std::string type = j.at("type").get<std::string>();
        auto kind = detector::AnomalyKindFromString(type);
        if (!kind) {
            return MakeError(ErrorCode::kDeserializationError,
                             absl::StrCat("Unknown anomaly type '", type, "'"));
        }
        anomaly.kind = *kind;

        const std::string priority_name = j.at("priority").get<std::string>();
        auto priority = detector::PriorityFromString(priority_name);
        if (!priority) {
            return MakeError(ErrorCode::kDeserializationError,
                             absl::StrCat("Unknown priority '", priority_name, "'"));
        }
        anomaly.priority = *priority;

        anomaly.observed_value = j.at("observed_value").get<double>();
        anomaly.baseline_value = j.at("baseline_value").get<double>();
        anomaly.threshold = j.at("threshold").get<double>();
        anomaly.deviation = j.at("deviation").get<double>();
        anomaly.threshold_violated = j.value("threshold_violated", false);
        anomaly.statistical_violated = j.value("statistical_violated", false);
        anomaly.timestamp = snapshot::FromEpochMillis(j.at("timestamp").get<int64_t>());
        anomaly.description = j.value("description", "");
        return anomaly;
    } catch (const json::exception& e) {
        return DecodeError("anomaly", e);
    }
}

json DetectionResultToJson(const detector::DetectionResult& result) {
    auto encode_bucket = [](const std::vector<Anomaly>& bucket) {
        json array = json::array();
        for (const auto& anomaly : bucket) {
            array.push_back(AnomalyToJson(anomaly));
        }
        return array;
    };

    json j;
    j["anomalies"] = {
        {"high_priority", encode_bucket(result.anomalies.high)},
        {"medium_priority", encode_bucket(result.anomalies.medium)},
        {"low_priority", encode_bucket(result.anomalies.low)}
    };
    j["detection_timestamp"] = snapshot::ToEpochMillis(result.detection_timestamp);
    j["metrics_summary"] = {
        {"total_services", result.metrics_summary.total_services},
        {"services_with_anomalies", result.metrics_summary.services_with_anomalies}
    };
    j["diagnostics"] = result.diagnostics;
    return j;
}

absl::StatusOr<detector::DetectionResult> DetectionResultFromJson(const json& j) {
    try {
        detector::DetectionResult result;

        const auto& anomalies = j.at("anomalies");
        for (const char* bucket : {"high_priority", "medium_priority", "low_priority"}) {
            for (const auto& anomaly_json : anomalies.at(bucket)) {
                SKYRCA_ASSIGN_OR_RETURN(Anomaly anomaly, AnomalyFromJson(anomaly_json));
                result.anomalies.Add(std::move(anomaly));
            }
        }

        result.detection_timestamp =
            snapshot::FromEpochMillis(j.at("detection_timestamp").get<int64_t>());
        const auto& summary = j.at("metrics_summary");
        result.metrics_summary.total_services = summary.at("total_services").get<size_t>();
        result.metrics_summary.services_with_anomalies =
            summary.at("services_with_anomalies").get<size_t>();
        result.diagnostics = ReadDiagnostics(j);
        return result;
    } catch (const json::exception& e) {
        return DecodeError("detection result", e);
    }
}

json RootCauseReportToJson(const rca::RootCauseReport& report) {
    json root_causes = json::array();
    for (const auto& candidate : report.root_causes) {
        root_causes.push_back(CandidateToJson(candidate));
    }

    json j;
    j["analysis_timestamp"] = snapshot::ToEpochMillis(report.analysis_timestamp);
    j["service_graph_stats"] = {
        {"nodes", report.service_graph_stats.nodes},
        {"edges", report.service_graph_stats.edges}
    };
    j["root_causes"] = root_causes;
    j["services_analyzed"] = report.services_analyzed;
    j["diagnostics"] = report.diagnostics;
    return j;
}

absl::StatusOr<rca::RootCauseReport> RootCauseReportFromJson(const json& j) {
    try {
        rca::RootCauseReport report;
        report.analysis_timestamp =
            snapshot::FromEpochMillis(j.at("analysis_timestamp").get<int64_t>());
        const auto& stats = j.at("service_graph_stats");
        report.service_graph_stats.nodes = stats.at("nodes").get<size_t>();
        report.service_graph_stats.edges = stats.at("edges").get<size_t>();

        for (const auto& candidate_json : j.at("root_causes")) {
            SKYRCA_ASSIGN_OR_RETURN(rca::RootCauseCandidate candidate,
                                    CandidateFromJson(candidate_json));
            report.root_causes.push_back(std::move(candidate));
        }
        report.services_analyzed = j.value("services_analyzed", report.root_causes.size());
        report.diagnostics = ReadDiagnostics(j);
        return report;
    } catch (const json::exception& e) {
        return DecodeError("root-cause report", e);
    }
}

}  // namespace skyrca::report
