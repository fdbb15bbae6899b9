#pragma once

/// @file narrative_annotator.h
/// @brief Prose summaries of analysis results
///
/// Narratives consume analysis output only; nothing they produce feeds back
/// into detection or scoring.

#include <map>
#include <string>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "detector/anomaly.h"
#include "rca/root_cause.h"

namespace skyrca::pipeline {

/// @brief Prose keyed by analysis type
struct Narrative {
    static constexpr const char* kAnomalyAnalysis = "anomaly_analysis";
    static constexpr const char* kRootCauseAnalysis = "root_cause_analysis";
    static constexpr const char* kComprehensiveReport = "comprehensive_report";

    std::map<std::string, std::string> sections;
};

/// @brief Encode a narrative as {analysis_type: text}
nlohmann::json NarrativeToJson(const Narrative& narrative);

/// @brief Produces prose for an analysis pass (typically backed by an LLM service)
class NarrativeAnnotator {
public:
    virtual ~NarrativeAnnotator() = default;

    /// @brief Describe the detection result and root-cause report
    virtual absl::StatusOr<Narrative> Annotate(const detector::DetectionResult& detection,
                                               const rca::RootCauseReport& report) = 0;
};

/// @brief Offline annotator rendering fixed templates from the results
class TemplateNarrativeAnnotator : public NarrativeAnnotator {
public:
    absl::StatusOr<Narrative> Annotate(const detector::DetectionResult& detection,
                                       const rca::RootCauseReport& report) override;
};

}  // namespace skyrca::pipeline
