#pragma once

/// @file result_sink.h
/// @brief Destinations for analysis outcomes

#include <filesystem>
#include <mutex>
#include <vector>

#include <absl/status/status.h>

#include "pipeline/analysis_outcome.h"

namespace skyrca::pipeline {

/// @brief Receives the outcome of every pipeline run
class ResultSink {
public:
    virtual ~ResultSink() = default;

    /// @brief Persist or forward one outcome
    virtual absl::Status Write(const AnalysisOutcome& outcome) = 0;
};

/// @brief Writes each outcome as JSON documents into a directory
///
/// Files are named after the detection timestamp (UTC):
/// anomalies_<ts>.json, root_causes_<ts>.json, ai_analysis_<ts>.json (when a
/// narrative exists) and summary_report_<ts>.txt.
class JsonFileResultSink : public ResultSink {
public:
    explicit JsonFileResultSink(std::filesystem::path directory);

    absl::Status Write(const AnalysisOutcome& outcome) override;

    const std::filesystem::path& Directory() const { return directory_; }

    /// @brief Files written by the most recent successful Write
    std::vector<std::filesystem::path> WrittenFiles() const;

private:
    std::filesystem::path directory_;
    std::vector<std::filesystem::path> written_;
    mutable std::mutex mutex_;
};

/// @brief Keeps outcomes in memory
class MemoryResultSink : public ResultSink {
public:
    absl::Status Write(const AnalysisOutcome& outcome) override;

    std::vector<AnalysisOutcome> Outcomes() const;
    size_t Size() const;

private:
    std::vector<AnalysisOutcome> outcomes_;
    mutable std::mutex mutex_;
};

}  // namespace skyrca::pipeline
