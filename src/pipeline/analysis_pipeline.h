#pragma once

/// @file analysis_pipeline.h
/// @brief End-to-end run: snapshot -> graph -> detection -> root causes -> narrative -> sink

#include <memory>

#include <absl/status/statusor.h>

#include "detector/anomaly_detector.h"
#include "pipeline/analysis_outcome.h"
#include "pipeline/narrative_annotator.h"
#include "pipeline/pipeline_config.h"
#include "pipeline/result_sink.h"
#include "rca/root_cause_analyzer.h"
#include "snapshot/snapshot_source.h"
#include "snapshot/types.h"

namespace skyrca::pipeline {

/// @brief Orchestrates one analysis pass per call
///
/// The annotator and sink are optional; their failures are logged and
/// recorded as diagnostics but never fail the run.
///
/// Example:
/// @code
///   auto sink = std::make_shared<JsonFileResultSink>("./results");
///   AnalysisPipeline pipeline(config, nullptr, sink);
///   snapshot::FileSnapshotSource source("snapshot.json");
///   auto outcome = pipeline.Run(source);
/// @endcode
class AnalysisPipeline {
public:
    AnalysisPipeline(PipelineConfig config,
                     std::shared_ptr<NarrativeAnnotator> annotator = nullptr,
                     std::shared_ptr<ResultSink> sink = nullptr);
    ~AnalysisPipeline();

    // Disable copy
    AnalysisPipeline(const AnalysisPipeline&) = delete;
    AnalysisPipeline& operator=(const AnalysisPipeline&) = delete;

    /// @brief Analyze an in-memory snapshot
    /// @return Outcome, or InvalidArgument when the configuration is invalid
    absl::StatusOr<AnalysisOutcome> Run(const snapshot::Snapshot& snapshot);

    /// @brief Fetch a snapshot from @p source and analyze it
    absl::StatusOr<AnalysisOutcome> Run(snapshot::SnapshotSource& source);

    const PipelineConfig& GetConfig() const { return config_; }

    const detector::AnomalyDetector& Detector() const { return *detector_; }
    const rca::RootCauseAnalyzer& Analyzer() const { return *analyzer_; }

private:
    void Annotate(AnalysisOutcome& outcome);
    void Publish(AnalysisOutcome& outcome);

    PipelineConfig config_;
    std::shared_ptr<NarrativeAnnotator> annotator_;
    std::shared_ptr<ResultSink> sink_;
    std::unique_ptr<detector::AnomalyDetector> detector_;
    std::unique_ptr<rca::RootCauseAnalyzer> analyzer_;
};

}  // namespace skyrca::pipeline
