/// @file result_sink.cpp
/// @brief JSON file and in-memory result sinks

#include "pipeline/result_sink.h"

#include <fstream>
#include <string>
#include <system_error>

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"
#include "report/report_json.h"

namespace skyrca::pipeline {

namespace {

absl::Status WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return absl::UnavailableError(
            absl::StrCat("Failed to open file for writing: ", path.string()));
    }
    file << content;
    file.close();
    if (file.fail()) {
        return MakeError(ErrorCode::kDataLoss,
                         absl::StrCat("Failed to write file: ", path.string()));
    }
    return absl::OkStatus();
}

}  // namespace

JsonFileResultSink::JsonFileResultSink(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

absl::Status JsonFileResultSink::Write(const AnalysisOutcome& outcome) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return absl::UnavailableError(absl::StrCat(
            "Cannot create results directory ", directory_.string(), ": ", ec.message()));
    }

    const std::string stamp = absl::FormatTime(
        "%Y%m%d_%H%M%S", absl::FromChrono(outcome.detection.detection_timestamp),
        absl::UTCTimeZone());

    std::vector<std::pair<std::filesystem::path, std::string>> documents;
    documents.emplace_back(directory_ / absl::StrCat("anomalies_", stamp, ".json"),
                           report::DetectionResultToJson(outcome.detection).dump(2));
    documents.emplace_back(directory_ / absl::StrCat("root_causes_", stamp, ".json"),
                           report::RootCauseReportToJson(outcome.report).dump(2));
    if (outcome.narrative) {
        documents.emplace_back(directory_ / absl::StrCat("ai_analysis_", stamp, ".json"),
                               NarrativeToJson(*outcome.narrative).dump(2));
    }
    documents.emplace_back(directory_ / absl::StrCat("summary_report_", stamp, ".txt"),
                           Summary(outcome));

    std::vector<std::filesystem::path> written;
    for (const auto& [path, content] : documents) {
        SKYRCA_RETURN_IF_ERROR(WriteFile(path, content));
        written.push_back(path);
    }

    SKYRCA_LOG_INFO("Wrote {} result files to {}", written.size(), directory_.string());
    std::lock_guard<std::mutex> lock(mutex_);
    written_ = std::move(written);
    return absl::OkStatus();
}

std::vector<std::filesystem::path> JsonFileResultSink::WrittenFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

absl::Status MemoryResultSink::Write(const AnalysisOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
    return absl::OkStatus();
}

std::vector<AnalysisOutcome> MemoryResultSink::Outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

size_t MemoryResultSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

}  // namespace skyrca::pipeline
