/// @file narrative_annotator.cpp
/// @brief Template-based narrative rendering

#include "pipeline/narrative_annotator.h"

#include <algorithm>
#include <map>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace skyrca::pipeline {

namespace {

std::string DescribeAnomalies(const detector::DetectionResult& detection) {
    const auto& anomalies = detection.anomalies;
    if (anomalies.Empty()) {
        return absl::StrCat("All ", detection.metrics_summary.total_services,
                            " monitored services behave normally.");
    }

    std::map<std::string, size_t> per_kind;
    for (const auto& anomaly : anomalies.Flatten()) {
        ++per_kind[std::string(detector::AnomalyKindToString(anomaly.kind))];
    }
    std::vector<std::string> kinds;
    for (const auto& [kind, count] : per_kind) {
        kinds.push_back(absl::StrCat(count, " ", kind));
    }

    std::string text = absl::StrFormat(
        "%d anomalies across %d of %d services (%d high, %d medium, %d low priority): %s.",
        anomalies.Size(), detection.metrics_summary.services_with_anomalies,
        detection.metrics_summary.total_services, anomalies.high.size(),
        anomalies.medium.size(), anomalies.low.size(), absl::StrJoin(kinds, ", "));
    if (!anomalies.high.empty()) {
        absl::StrAppend(&text, " Most urgent: ", anomalies.high.front().description, ".");
    }
    return text;
}

std::string DescribeRootCauses(const rca::RootCauseReport& report) {
    if (report.root_causes.empty()) {
        return "No service stands out as a likely origin of the anomalies.";
    }

    const auto& top = report.root_causes.front();
    std::string text = absl::StrFormat(
        "%s is the most likely origin (score %.2f, confidence %.0f%%, impact %s).",
        top.root_service_name, top.root_cause_score, top.confidence * 100.0,
        rca::ImpactSeverityToString(top.impact_analysis.impact_severity));
    if (report.root_causes.size() > 1) {
        std::vector<std::string> others;
        for (size_t i = 1; i < std::min<size_t>(report.root_causes.size(), 3); ++i) {
            others.push_back(report.root_causes[i].root_service_name);
        }
        absl::StrAppend(&text, " Other candidates: ", absl::StrJoin(others, ", "), ".");
    }
    absl::StrAppend(&text, " Suggested steps: ", top.recommendation, ".");
    return text;
}

}  // namespace

nlohmann::json NarrativeToJson(const Narrative& narrative) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [type, text] : narrative.sections) {
        j[type] = text;
    }
    return j;
}

absl::StatusOr<Narrative> TemplateNarrativeAnnotator::Annotate(
    const detector::DetectionResult& detection, const rca::RootCauseReport& report) {
    Narrative narrative;
    std::string anomaly_text = DescribeAnomalies(detection);
    std::string root_cause_text = DescribeRootCauses(report);

    narrative.sections[Narrative::kComprehensiveReport] = absl::StrCat(
        anomaly_text, " ", root_cause_text, " ", report.service_graph_stats.nodes,
        " services and ", report.service_graph_stats.edges, " call relations were analyzed.");
    narrative.sections[Narrative::kAnomalyAnalysis] = std::move(anomaly_text);
    narrative.sections[Narrative::kRootCauseAnalysis] = std::move(root_cause_text);
    return narrative;
}

}  // namespace skyrca::pipeline
