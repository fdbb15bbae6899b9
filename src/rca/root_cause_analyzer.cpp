/// @file root_cause_analyzer.cpp
/// @brief Root-cause ranking implementation

#include "rca/root_cause_analyzer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "common/thread_pool.h"

namespace skyrca::rca {

using detector::Anomaly;
using detector::AnomalyKind;

std::string_view ImpactSeverityToString(ImpactSeverity severity) {
    switch (severity) {
        case ImpactSeverity::kHigh: return "HIGH";
        case ImpactSeverity::kMedium: return "MEDIUM";
        case ImpactSeverity::kLow: return "LOW";
    }
    return "LOW";
}

std::optional<ImpactSeverity> ImpactSeverityFromString(std::string_view name) {
    if (name == "HIGH") return ImpactSeverity::kHigh;
    if (name == "MEDIUM") return ImpactSeverity::kMedium;
    if (name == "LOW") return ImpactSeverity::kLow;
    return std::nullopt;
}

absl::Status RootCauseAnalyzerConfig::Validate() const {
    if (max_depth == 0) {
        return ConfigurationError("max_depth must be at least 1");
    }
    if (!std::isfinite(correlation_threshold) || correlation_threshold < 0.0) {
        return ConfigurationError(absl::StrCat(
            "correlation_threshold must be non-negative, got ", correlation_threshold));
    }
    if (time_correlation_window.count() <= 0) {
        return ConfigurationError(absl::StrCat(
            "time_correlation_window must be positive, got ", time_correlation_window.count()));
    }
    if (!std::isfinite(propagation_decay) || propagation_decay <= 0.0 || propagation_decay > 1.0) {
        return ConfigurationError(absl::StrCat(
            "propagation_decay must be within (0, 1], got ", propagation_decay));
    }
    if (impact_medium_count == 0) {
        return ConfigurationError("impact_medium_count must be at least 1");
    }
    if (impact_high_count < impact_medium_count) {
        return ConfigurationError(absl::StrCat(
            "impact_high_count (", impact_high_count, ") must not be below impact_medium_count (",
            impact_medium_count, ")"));
    }
    if (worker_threads == 0) {
        return ConfigurationError("worker_threads must be at least 1");
    }
    return absl::OkStatus();
}

double LocalDensity(const std::vector<const Anomaly*>& anomalies) {
    double density = 0.0;
    for (const auto* anomaly : anomalies) {
        density += detector::PriorityWeight(anomaly->priority);
    }
    return density;
}

double ComputeConfidence(size_t anomaly_count, size_t corroborating, double strong_share) {
    double evidence = static_cast<double>(std::min<size_t>(anomaly_count, 3)) / 3.0;
    double corroboration = 1.0 - 1.0 / (1.0 + static_cast<double>(corroborating));
    double confidence = 0.2 + 0.2 * evidence +
                        0.6 * corroboration * (0.5 + 0.5 * strong_share);
    return std::clamp(confidence, 0.0, 1.0);
}

std::string BuildRecommendation(const RootCauseCandidate& candidate) {
    const std::string& name = candidate.root_service_name.empty()
        ? candidate.root_service : candidate.root_service_name;

    std::set<AnomalyKind> kinds;
    for (const auto& anomaly : candidate.anomalies) {
        kinds.insert(anomaly.kind);
    }

    std::vector<std::string> steps;
    if (kinds.count(AnomalyKind::kErrorRateSpike)) {
        steps.push_back(absl::StrCat(
            "Check the error logs of ", name, " for the cause of the rising error rate"));
    }
    if (kinds.count(AnomalyKind::kLatencySpike)) {
        steps.push_back(absl::StrCat(
            "Profile ", name, " for performance bottlenecks; optimize hot paths or add resources"));
    }
    if (kinds.count(AnomalyKind::kThroughputDrop)) {
        steps.push_back(absl::StrCat("Check the availability of ", name, " and its instances"));
    }
    if (kinds.count(AnomalyKind::kThroughputUnstable)) {
        steps.push_back(absl::StrCat(
            "Review load balancing and resource allocation of ", name));
    }

    size_t affected = candidate.impact_analysis.affected_services.size();
    if (affected > 0) {
        steps.push_back(absl::StrCat("Prioritize ", name, ": it affects ", affected,
                                     affected == 1 ? " downstream service" : " downstream services"));
    }
    if (candidate.impact_analysis.impact_severity == ImpactSeverity::kHigh) {
        steps.push_back("Immediate action recommended: impact severity is high");
    }

    if (steps.empty()) {
        return absl::StrCat("Investigate the anomalies of ", name, " further");
    }
    return absl::StrJoin(steps, " | ");
}

RootCauseAnalyzer::RootCauseAnalyzer(RootCauseAnalyzerConfig config)
    : config_(std::move(config)) {}

RootCauseAnalyzer::~RootCauseAnalyzer() = default;

double RootCauseAnalyzer::CriticalityScore(const graph::ServiceGraph& graph,
                                           const std::string& id) {
    size_t n = graph.NodeCount();
    if (n <= 1) {
        return 0.0;
    }
    double others = static_cast<double>(n - 1);
    return kFanInWeight * static_cast<double>(graph.FanIn(id)) / others +
           kFanOutWeight * static_cast<double>(graph.FanOut(id)) / others;
}

absl::StatusOr<RootCauseReport> RootCauseAnalyzer::Analyze(
    const detector::DetectionResult& detection, const graph::ServiceGraph& graph) {
    SKYRCA_RETURN_IF_ERROR(config_.Validate());
    SKYRCA_TIMER(SKYRCA_HISTOGRAM("skyrca.rca.analysis_seconds"));

    RootCauseReport report;
    report.analysis_timestamp = detection.detection_timestamp;
    report.service_graph_stats = graph.Stats();

    if (detection.anomalies.Empty()) {
        report.diagnostics.push_back("system healthy: no anomalies detected");
        SKYRCA_LOG_INFO("Root-cause analysis skipped: system healthy");
        return report;
    }
    if (graph.NodeCount() == 0) {
        report.diagnostics.push_back("no data to analyze: service graph is empty");
        SKYRCA_LOG_WARN("Root-cause analysis skipped: service graph is empty");
        return report;
    }

    // Index anomalies by graph node, keeping priority-then-detection order
    AnomalyIndex index;
    std::set<std::string> unmapped;
    for (const auto* bucket : {&detection.anomalies.high, &detection.anomalies.medium,
                               &detection.anomalies.low}) {
        for (const auto& anomaly : *bucket) {
            auto id = graph.ResolveId(anomaly.service_id);
            if (!id) {
                id = graph.ResolveId(anomaly.service_name);
            }
            if (!id) {
                unmapped.insert(anomaly.service_id);
                continue;
            }
            index[*id].push_back(&anomaly);
        }
    }
    for (const auto& service : unmapped) {
        report.diagnostics.push_back(
            absl::StrCat("Service '", service, "' has anomalies but is not in the service graph"));
    }
    if (index.empty()) {
        report.diagnostics.push_back(
            "no data to analyze: no anomalous service maps onto the service graph");
        SKYRCA_LOG_WARN("Root-cause analysis skipped: no anomalous service in the graph");
        return report;
    }

    std::vector<std::string> services;
    services.reserve(index.size());
    for (const auto& [id, anomalies] : index) {
        services.push_back(id);
    }
    report.services_analyzed = services.size();

    struct CandidateWork {
        std::vector<Contribution> contributions;
        graph::HopMap downstream;
    };
    auto work = ParallelMap(services.size(), config_.worker_threads,
        [this, &services, &index, &graph](size_t i) {
            CandidateWork result;
            result.contributions = Propagate(services[i], index, graph);
            result.downstream = graph.ReachableDownstream(services[i], config_.max_depth);
            return result;
        });

    // Merge propagated evidence in service order so sums are reproducible
    struct Evidence {
        double propagated = 0.0;
        size_t corroborating = 0;
        size_t strong = 0;
    };
    std::map<std::string, Evidence> evidence;
    for (const auto& item : work) {
        for (const auto& contribution : item.contributions) {
            auto& e = evidence[contribution.upstream];
            e.propagated += contribution.amount;
            ++e.corroborating;
            if (contribution.strong) {
                ++e.strong;
            }
        }
    }

    size_t filtered = 0;
    for (size_t i = 0; i < services.size(); ++i) {
        const std::string& service = services[i];
        const auto& owned = index.at(service);

        Evidence e;
        if (auto it = evidence.find(service); it != evidence.end()) {
            e = it->second;
        }

        double criticality = CriticalityScore(graph, service);
        double score = LocalDensity(owned) * (1.0 + criticality) + e.propagated;
        if (score < config_.correlation_threshold) {
            ++filtered;
            SKYRCA_LOG_DEBUG("Candidate {} dropped: score {:.3f} below {:.3f}",
                             service, score, config_.correlation_threshold);
            continue;
        }

        RootCauseCandidate candidate;
        candidate.root_service = service;
        const auto* node = graph.FindNode(service);
        candidate.root_service_name = node != nullptr && !node->name.empty() ? node->name : service;
        candidate.root_cause_score = score;
        candidate.criticality_score = criticality;

        double strong_share = e.corroborating == 0
            ? 0.0
            : static_cast<double>(e.strong) / static_cast<double>(e.corroborating);
        candidate.confidence = ComputeConfidence(owned.size(), e.corroborating, strong_share);

        candidate.anomalies.reserve(owned.size());
        for (const auto* anomaly : owned) {
            candidate.anomalies.push_back(*anomaly);
        }

        candidate.impact_analysis = AnalyzeImpact(service, work[i].downstream, index);
        candidate.upstream_services = graph.Upstream(service);
        for (const auto& [id, hops] : work[i].downstream) {
            candidate.downstream_services.push_back(id);
        }
        candidate.recommendation = BuildRecommendation(candidate);

        report.root_causes.push_back(std::move(candidate));
    }

    std::sort(report.root_causes.begin(), report.root_causes.end(),
        [](const RootCauseCandidate& a, const RootCauseCandidate& b) {
            if (a.root_cause_score != b.root_cause_score) {
                return a.root_cause_score > b.root_cause_score;
            }
            if (a.confidence != b.confidence) {
                return a.confidence > b.confidence;
            }
            if (a.criticality_score != b.criticality_score) {
                return a.criticality_score > b.criticality_score;
            }
            return a.root_service < b.root_service;
        });

    SKYRCA_COUNTER("skyrca.rca.candidates").Add(static_cast<int64_t>(report.root_causes.size()));
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.analyses;
        stats_.candidates_reported += report.root_causes.size();
        stats_.candidates_filtered += filtered;
    }

    if (report.root_causes.empty()) {
        SKYRCA_LOG_INFO("Root-cause analysis: {} anomalous services, no candidate above {:.2f}",
                        services.size(), config_.correlation_threshold);
    } else {
        const auto& top = report.root_causes.front();
        SKYRCA_LOG_INFO("Root-cause analysis: {} candidates, top {} (score {:.3f}, confidence {:.2f})",
                        report.root_causes.size(), top.root_service, top.root_cause_score,
                        top.confidence);
    }

    return report;
}

std::vector<RootCauseAnalyzer::Contribution> RootCauseAnalyzer::Propagate(
    const std::string& service, const AnomalyIndex& index,
    const graph::ServiceGraph& graph) const {
    std::vector<Contribution> contributions;

    const auto& own = index.at(service);
    const double local = LocalDensity(own);
    const double window_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.time_correlation_window).count());

    for (const auto& [upstream, hops] : graph.ReachableUpstream(service, config_.max_depth)) {
        auto it = index.find(upstream);
        if (it == index.end()) {
            continue;
        }

        // Smallest time gap between any pair of their anomalies
        double gap_ms = std::numeric_limits<double>::infinity();
        for (const auto* theirs : it->second) {
            for (const auto* mine : own) {
                auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(
                    theirs->timestamp - mine->timestamp).count();
                gap_ms = std::min(gap_ms, static_cast<double>(std::llabs(diff)));
            }
        }
        if (gap_ms >= window_ms) {
            continue;
        }

        double strength = 1.0 - gap_ms / window_ms;
        Contribution contribution;
        contribution.upstream = upstream;
        contribution.amount = local * std::pow(config_.propagation_decay,
                                               static_cast<double>(hops)) * strength;
        contribution.strong = strength >= kStrongCorrelation;
        contributions.push_back(std::move(contribution));
    }

    return contributions;
}

ImpactAnalysis RootCauseAnalyzer::AnalyzeImpact(const std::string& service,
                                                const graph::HopMap& downstream,
                                                const AnomalyIndex& index) const {
    ImpactAnalysis impact;

    for (const auto& [id, hops] : downstream) {
        auto it = index.find(id);
        if (it == index.end()) {
            continue;
        }
        AffectedService affected;
        affected.service_id = id;
        affected.distance = hops;
        affected.anomaly_count = it->second.size();
        affected.mean_priority_weight =
            LocalDensity(it->second) / static_cast<double>(it->second.size());
        impact.affected_services.push_back(std::move(affected));
    }

    std::stable_sort(impact.affected_services.begin(), impact.affected_services.end(),
        [](const AffectedService& a, const AffectedService& b) {
            return a.distance < b.distance;
        });

    size_t count = impact.affected_services.size();
    if (count >= config_.impact_high_count) {
        impact.impact_severity = ImpactSeverity::kHigh;
    } else if (count >= config_.impact_medium_count) {
        impact.impact_severity = ImpactSeverity::kMedium;
    } else {
        impact.impact_severity = ImpactSeverity::kLow;
    }

    SKYRCA_LOG_DEBUG("Impact of {}: {} affected downstream services ({})",
                     service, count, ImpactSeverityToString(impact.impact_severity));
    return impact;
}

RootCauseAnalyzer::Stats RootCauseAnalyzer::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void RootCauseAnalyzer::ResetStats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

std::unique_ptr<RootCauseAnalyzer> CreateRootCauseAnalyzer(RootCauseAnalyzerConfig config) {
    return std::make_unique<RootCauseAnalyzer>(std::move(config));
}

}  // namespace skyrca::rca
