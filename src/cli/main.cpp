/// @file main.cpp
/// @brief SkyRCA command-line entry point

#include <iostream>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "pipeline/analysis_pipeline.h"
#include "pipeline/narrative_annotator.h"
#include "pipeline/pipeline_config.h"
#include "pipeline/result_sink.h"
#include "snapshot/snapshot_source.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitNoData = 2;

constexpr const char* kVersion = "SkyRCA v1.0.0";

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"SkyRCA - anomaly detection and root cause analysis for microservice snapshots"};

    std::string snapshot_path;
    std::string config_path;
    std::string output_dir;
    std::string log_level;
    size_t threads = 0;
    bool no_narrative = false;

    app.add_option("--snapshot", snapshot_path, "Path to a JSON monitoring snapshot")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--output-dir", output_dir, "Directory for result files");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--threads", threads, "Worker threads for detection and analysis");
    app.add_flag("--no-ai", no_narrative, "Skip the narrative report");
    app.set_version_flag("-v,--version", kVersion);

    CLI11_PARSE(app, argc, argv);

    // Layered configuration: file, then SKYRCA_* environment overrides
    skyrca::Config config;
    if (!config_path.empty()) {
        auto loaded = skyrca::Config::LoadFromFile(config_path);
        if (!loaded.ok()) {
            std::cerr << "Failed to load config: " << loaded.status().message() << std::endl;
            return kExitFailure;
        }
        config = std::move(*loaded);
    }
    config.Merge(skyrca::Config::LoadFromEnvironment("SKYRCA_"));

    // Apply CLI overrides
    if (!output_dir.empty()) {
        config.Set("output.results_dir", output_dir);
    }
    if (!log_level.empty()) {
        config.Set("logging.level", log_level);
    }
    if (no_narrative) {
        config.Set("narrative.enabled", false);
    }
    if (threads > 0) {
        config.Set("anomaly_detection.worker_threads", static_cast<int64_t>(threads));
        config.Set("root_cause_analysis.worker_threads", static_cast<int64_t>(threads));
    }

    auto pipeline_config = skyrca::pipeline::PipelineConfig::FromConfig(config);
    if (!pipeline_config.ok()) {
        std::cerr << "Invalid configuration: " << pipeline_config.status().message() << std::endl;
        return kExitFailure;
    }

    skyrca::InitLogging(pipeline_config->logging);
    SKYRCA_LOG_INFO("{} starting", kVersion);
    SKYRCA_LOG_INFO("Configuration:");
    SKYRCA_LOG_INFO("  Snapshot: {}", snapshot_path);
    SKYRCA_LOG_INFO("  Results dir: {}", pipeline_config->results_dir);
    SKYRCA_LOG_INFO("  Time window: {} min", pipeline_config->detector.time_window.count());
    SKYRCA_LOG_INFO("  Max depth: {}", pipeline_config->analyzer.max_depth);
    SKYRCA_LOG_INFO("  Narrative: {}", pipeline_config->enable_narrative ? "on" : "off");

    auto annotator = std::make_shared<skyrca::pipeline::TemplateNarrativeAnnotator>();
    auto sink = std::make_shared<skyrca::pipeline::JsonFileResultSink>(
        pipeline_config->results_dir);
    skyrca::pipeline::AnalysisPipeline pipeline(*pipeline_config, annotator, sink);

    skyrca::snapshot::FileSnapshotSource source(snapshot_path);
    auto outcome = pipeline.Run(source);
    if (!outcome.ok()) {
        SKYRCA_LOG_ERROR("Analysis failed: {}", outcome.status().ToString());
        skyrca::ShutdownLogging();
        return kExitFailure;
    }

    std::cout << skyrca::pipeline::Summary(*outcome) << std::endl;

    for (const auto& path : sink->WrittenFiles()) {
        SKYRCA_LOG_INFO("  Wrote {}", path.string());
    }
    SKYRCA_LOG_INFO("Analysis finished: {}",
                    skyrca::pipeline::OutcomeStatusToString(outcome->status));
    skyrca::ShutdownLogging();

    return outcome->status == skyrca::pipeline::OutcomeStatus::kNoData ? kExitNoData : kExitOk;
}
