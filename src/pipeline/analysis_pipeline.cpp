/// @file analysis_pipeline.cpp
/// @brief Analysis pipeline implementation

#include "pipeline/analysis_pipeline.h"

#include <iterator>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "graph/service_graph.h"

namespace skyrca::pipeline {

namespace {

void Append(std::vector<std::string>& target, const std::vector<std::string>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

}  // namespace

AnalysisPipeline::AnalysisPipeline(PipelineConfig config,
                                   std::shared_ptr<NarrativeAnnotator> annotator,
                                   std::shared_ptr<ResultSink> sink)
    : config_(std::move(config)),
      annotator_(std::move(annotator)),
      sink_(std::move(sink)),
      detector_(detector::CreateAnomalyDetector(config_.detector)),
      analyzer_(rca::CreateRootCauseAnalyzer(config_.analyzer)) {}

AnalysisPipeline::~AnalysisPipeline() = default;

absl::StatusOr<AnalysisOutcome> AnalysisPipeline::Run(snapshot::SnapshotSource& source) {
    SKYRCA_RETURN_IF_ERROR(config_.Validate());
    SKYRCA_ASSIGN_OR_RETURN(snapshot::Snapshot snapshot, source.Fetch());
    return Run(snapshot);
}

absl::StatusOr<AnalysisOutcome> AnalysisPipeline::Run(const snapshot::Snapshot& snapshot) {
    SKYRCA_RETURN_IF_ERROR(config_.Validate());

    AnalysisOutcome outcome;
    Append(outcome.diagnostics, snapshot.warnings);

    auto graph = graph::ServiceGraph::FromTopology(snapshot.topology);
    Append(outcome.diagnostics, graph.Warnings());

    SKYRCA_ASSIGN_OR_RETURN(outcome.detection, detector_->Detect(snapshot, graph));
    Append(outcome.diagnostics, outcome.detection.diagnostics);

    if (outcome.detection.anomalies.Empty()) {
        outcome.report.analysis_timestamp = outcome.detection.detection_timestamp;
        outcome.report.service_graph_stats = graph.Stats();
        if (snapshot.services.empty() && graph.NodeCount() == 0) {
            outcome.status = OutcomeStatus::kNoData;
            outcome.diagnostics.push_back("no data to analyze: snapshot has no services");
            SKYRCA_LOG_WARN("Snapshot contains no services and no topology");
        } else {
            outcome.status = OutcomeStatus::kHealthy;
            outcome.diagnostics.push_back("system healthy: no anomalies detected");
            SKYRCA_LOG_INFO("System healthy: no anomalies in {} services",
                            snapshot.services.size());
        }
        return outcome;
    }

    SKYRCA_ASSIGN_OR_RETURN(outcome.report, analyzer_->Analyze(outcome.detection, graph));
    Append(outcome.diagnostics, outcome.report.diagnostics);
    outcome.status = outcome.report.services_analyzed == 0
        ? OutcomeStatus::kNoData
        : OutcomeStatus::kAnomaliesFound;

    if (config_.enable_narrative) {
        Annotate(outcome);
    }
    Publish(outcome);

    return outcome;
}

void AnalysisPipeline::Annotate(AnalysisOutcome& outcome) {
    if (!annotator_) {
        SKYRCA_LOG_DEBUG("Narrative enabled but no annotator attached");
        return;
    }

    auto narrative = annotator_->Annotate(outcome.detection, outcome.report);
    if (!narrative.ok()) {
        SKYRCA_LOG_WARN("Narrative annotation failed: {}", narrative.status().ToString());
        outcome.diagnostics.push_back(
            absl::StrCat("narrative unavailable: ", narrative.status().message()));
        return;
    }
    outcome.narrative = std::move(*narrative);
}

void AnalysisPipeline::Publish(AnalysisOutcome& outcome) {
    if (!sink_) {
        return;
    }

    auto status = sink_->Write(outcome);
    if (!status.ok()) {
        SKYRCA_LOG_ERROR("Failed to write results: {}", status.ToString());
        outcome.diagnostics.push_back(
            absl::StrCat("result sink failed: ", status.message()));
    }
}

}  // namespace skyrca::pipeline
