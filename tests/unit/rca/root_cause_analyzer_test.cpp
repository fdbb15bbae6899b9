/// @file root_cause_analyzer_test.cpp
/// @brief Tests for root-cause ranking

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "rca/root_cause_analyzer.h"
#include "report/report_json.h"

namespace skyrca::rca {
namespace {

using detector::Anomaly;
using detector::AnomalyKind;
using detector::DetectionResult;
using detector::Priority;
using snapshot::CallEdge;
using snapshot::ServiceNode;
using snapshot::Timestamp;

const Timestamp kBase = snapshot::FromEpochMillis(1714557600000);

Timestamp At(int minute) {
    return kBase + std::chrono::minutes(minute);
}

Anomaly MakeAnomaly(const std::string& service, Priority priority, int minute,
                    AnomalyKind kind = AnomalyKind::kLatencySpike) {
    Anomaly anomaly;
    anomaly.service_id = service;
    anomaly.service_name = service;
    anomaly.metric_name = kind == AnomalyKind::kLatencySpike ? "service_resp_time" : "service_sla";
    anomaly.kind = kind;
    anomaly.priority = priority;
    anomaly.observed_value = 1200.0;
    anomaly.baseline_value = 200.0;
    anomaly.threshold = 1000.0;
    anomaly.deviation = 5.0;
    anomaly.threshold_violated = priority != Priority::kLow;
    anomaly.statistical_violated = priority == Priority::kHigh;
    anomaly.timestamp = At(minute);
    anomaly.description = "test anomaly on " + service;
    return anomaly;
}

DetectionResult Detection(const std::vector<Anomaly>& anomalies, size_t total_services = 3) {
    DetectionResult detection;
    detection.detection_timestamp = At(60);
    detection.metrics_summary.total_services = total_services;
    for (const auto& anomaly : anomalies) {
        detection.anomalies.Add(anomaly);
    }
    return detection;
}

graph::ServiceGraph Graph(const std::vector<std::string>& ids, const std::vector<CallEdge>& edges) {
    std::vector<ServiceNode> nodes;
    for (const auto& id : ids) {
        ServiceNode node;
        node.id = id;
        node.name = id;
        nodes.push_back(node);
    }
    return graph::ServiceGraph::Build(nodes, edges);
}

const RootCauseCandidate* Find(const RootCauseReport& report, const std::string& id) {
    for (const auto& candidate : report.root_causes) {
        if (candidate.root_service == id) {
            return &candidate;
        }
    }
    return nullptr;
}

class RootCauseAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // A calls B, B calls C
        chain_ = Graph({"A", "B", "C"}, {{"A", "B"}, {"B", "C"}});
    }

    RootCauseReport Analyze(const DetectionResult& detection, const graph::ServiceGraph& graph) {
        auto report = analyzer_.Analyze(detection, graph);
        EXPECT_TRUE(report.ok()) << report.status().message();
        return report.ok() ? *std::move(report) : RootCauseReport{};
    }

    RootCauseAnalyzer analyzer_;
    graph::ServiceGraph chain_;
};

TEST_F(RootCauseAnalyzerTest, DirectlyAnomalousLeafRanksFirst) {
    auto report = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10)}), chain_);

    ASSERT_EQ(report.root_causes.size(), 1u);
    EXPECT_EQ(report.root_causes[0].root_service, "C");
    EXPECT_EQ(report.services_analyzed, 1u);
    EXPECT_EQ(report.root_causes[0].upstream_services, (std::vector<std::string>{"B"}));
    EXPECT_TRUE(report.root_causes[0].downstream_services.empty());
}

TEST_F(RootCauseAnalyzerTest, UncorrelatedCallerDoesNotOutrankLeaf) {
    // B's symptom is 30 minutes away from C's, outside the 5 minute window
    auto report = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                     MakeAnomaly("B", Priority::kMedium, 40)}),
                          chain_);

    ASSERT_EQ(report.root_causes.size(), 2u);
    EXPECT_EQ(report.root_causes[0].root_service, "C");
    EXPECT_EQ(report.root_causes[1].root_service, "B");
}

TEST_F(RootCauseAnalyzerTest, CorrelatedCallerRanksAtLeastAsHigh) {
    auto report = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                     MakeAnomaly("B", Priority::kMedium, 11)}),
                          chain_);

    const auto* b = Find(report, "B");
    const auto* c = Find(report, "C");
    ASSERT_NE(b, nullptr);
    ASSERT_NE(c, nullptr);
    EXPECT_GE(b->root_cause_score, c->root_cause_score);
    EXPECT_EQ(report.root_causes[0].root_service, "B");
    // Corroboration raises confidence
    EXPECT_GT(b->confidence, c->confidence);

    // B's impact covers the anomalous callee
    ASSERT_EQ(b->impact_analysis.affected_services.size(), 1u);
    EXPECT_EQ(b->impact_analysis.affected_services[0].service_id, "C");
    EXPECT_EQ(b->impact_analysis.affected_services[0].distance, 1u);
    EXPECT_DOUBLE_EQ(b->impact_analysis.affected_services[0].mean_priority_weight, 3.0);
    EXPECT_EQ(b->impact_analysis.impact_severity, ImpactSeverity::kMedium);
    EXPECT_EQ(b->downstream_services, (std::vector<std::string>{"C"}));
}

TEST_F(RootCauseAnalyzerTest, PropagationDecaysWithDistance) {
    auto near = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                   MakeAnomaly("B", Priority::kLow, 10)}),
                        chain_);
    auto far = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                  MakeAnomaly("A", Priority::kLow, 10)}),
                       chain_);

    const auto* b = Find(near, "B");
    const auto* a = Find(far, "A");
    ASSERT_NE(b, nullptr);
    ASSERT_NE(a, nullptr);

    double b_propagated = b->root_cause_score - 1.0 * (1.0 + b->criticality_score);
    double a_propagated = a->root_cause_score - 1.0 * (1.0 + a->criticality_score);
    EXPECT_NEAR(b_propagated, 3.0 * 0.5, 1e-9);
    EXPECT_NEAR(a_propagated, 3.0 * 0.25, 1e-9);
}

TEST_F(RootCauseAnalyzerTest, MaxDepthBoundsPropagation) {
    RootCauseAnalyzerConfig config;
    config.max_depth = 1;
    RootCauseAnalyzer analyzer(config);

    auto report = analyzer.Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                              MakeAnomaly("A", Priority::kMedium, 10)}),
                                   chain_);
    ASSERT_TRUE(report.ok());

    const auto* a = Find(*report, "A");
    ASSERT_NE(a, nullptr);
    EXPECT_NEAR(a->root_cause_score, 2.0 * (1.0 + a->criticality_score), 1e-9);
    EXPECT_EQ(a->downstream_services, (std::vector<std::string>{"B"}));
}

TEST_F(RootCauseAnalyzerTest, FanInRaisesCriticality) {
    std::vector<std::string> ids = {"hub", "leaf", "x"};
    std::vector<CallEdge> edges = {{"x", "leaf"}};
    for (int i = 0; i < 10; ++i) {
        std::string caller = "caller" + std::to_string(i);
        ids.push_back(caller);
        edges.push_back({caller, "hub"});
    }
    auto graph = Graph(ids, edges);
    ASSERT_EQ(graph.FanIn("hub"), 10u);
    ASSERT_EQ(graph.FanIn("leaf"), 1u);

    auto report = Analyze(Detection({MakeAnomaly("leaf", Priority::kLow, 10),
                                     MakeAnomaly("hub", Priority::kLow, 30)}),
                          graph);

    ASSERT_EQ(report.root_causes.size(), 2u);
    EXPECT_EQ(report.root_causes[0].root_service, "hub");
    EXPECT_GT(report.root_causes[0].criticality_score, report.root_causes[1].criticality_score);
    EXPECT_NEAR(report.root_causes[0].criticality_score, 0.6 * 10.0 / 12.0, 1e-12);
}

TEST_F(RootCauseAnalyzerTest, CandidatesSortedByScore) {
    auto graph = Graph({"gw", "orders", "users", "payments", "db"},
                       {{"gw", "orders"}, {"gw", "users"}, {"orders", "payments"},
                        {"payments", "db"}, {"users", "db"}});

    auto report = Analyze(Detection({MakeAnomaly("db", Priority::kHigh, 10),
                                     MakeAnomaly("payments", Priority::kMedium, 11),
                                     MakeAnomaly("users", Priority::kLow, 12),
                                     MakeAnomaly("gw", Priority::kLow, 40),
                                     MakeAnomaly("orders", Priority::kMedium, 2,
                                                 AnomalyKind::kErrorRateSpike)}, 5),
                          graph);

    ASSERT_EQ(report.root_causes.size(), 5u);
    for (size_t i = 1; i < report.root_causes.size(); ++i) {
        EXPECT_GE(report.root_causes[i - 1].root_cause_score,
                  report.root_causes[i].root_cause_score);
    }
    for (const auto& candidate : report.root_causes) {
        EXPECT_GE(candidate.confidence, 0.0);
        EXPECT_LE(candidate.confidence, 1.0);
        EXPECT_FALSE(candidate.recommendation.empty());
    }
    EXPECT_EQ(report.service_graph_stats.nodes, 5u);
    EXPECT_EQ(report.service_graph_stats.edges, 5u);
}

TEST_F(RootCauseAnalyzerTest, DeterministicAcrossRunsAndThreads) {
    auto graph = Graph({"gw", "orders", "users", "payments", "db"},
                       {{"gw", "orders"}, {"gw", "users"}, {"orders", "payments"},
                        {"payments", "db"}, {"users", "db"}, {"db", "gw"}});
    auto detection = Detection({MakeAnomaly("db", Priority::kHigh, 10),
                                MakeAnomaly("payments", Priority::kMedium, 11),
                                MakeAnomaly("users", Priority::kLow, 12),
                                MakeAnomaly("gw", Priority::kLow, 9),
                                MakeAnomaly("orders", Priority::kMedium, 10)}, 5);

    RootCauseAnalyzerConfig parallel_config;
    parallel_config.worker_threads = 4;
    RootCauseAnalyzer parallel(parallel_config);

    auto first = analyzer_.Analyze(detection, graph);
    auto second = analyzer_.Analyze(detection, graph);
    auto third = parallel.Analyze(detection, graph);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(third.ok());

    auto expected = report::RootCauseReportToJson(*first).dump();
    EXPECT_EQ(report::RootCauseReportToJson(*second).dump(), expected);
    EXPECT_EQ(report::RootCauseReportToJson(*third).dump(), expected);
}

TEST_F(RootCauseAnalyzerTest, MutualCallCycleTerminates) {
    auto graph = Graph({"X", "Y"}, {{"X", "Y"}, {"Y", "X"}});

    auto report = Analyze(Detection({MakeAnomaly("X", Priority::kMedium, 10),
                                     MakeAnomaly("Y", Priority::kMedium, 10)}, 2),
                          graph);

    ASSERT_EQ(report.root_causes.size(), 2u);
    for (const auto& candidate : report.root_causes) {
        ASSERT_EQ(candidate.impact_analysis.affected_services.size(), 1u);
        EXPECT_EQ(candidate.downstream_services.size(), 1u);
    }
    // Symmetric evidence: equal scores, ties broken by id
    EXPECT_DOUBLE_EQ(report.root_causes[0].root_cause_score, report.root_causes[1].root_cause_score);
    EXPECT_EQ(report.root_causes[0].root_service, "X");
}

TEST_F(RootCauseAnalyzerTest, CorrelationThresholdFiltersWeakCandidates) {
    RootCauseAnalyzerConfig config;
    config.correlation_threshold = 2.0;
    RootCauseAnalyzer analyzer(config);

    auto report = analyzer.Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                              MakeAnomaly("A", Priority::kLow, 50)}),
                                   chain_);
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->root_causes.size(), 1u);
    EXPECT_EQ(report->root_causes[0].root_service, "C");
    EXPECT_EQ(report->services_analyzed, 2u);
    EXPECT_EQ(analyzer.GetStats().candidates_filtered, 1u);
    EXPECT_EQ(analyzer.GetStats().candidates_reported, 1u);
}

TEST_F(RootCauseAnalyzerTest, NoAnomaliesMeansHealthy) {
    auto report = Analyze(Detection({}), chain_);

    EXPECT_TRUE(report.root_causes.empty());
    EXPECT_EQ(report.services_analyzed, 0u);
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_NE(report.diagnostics[0].find("system healthy"), std::string::npos);
    EXPECT_EQ(report.analysis_timestamp, At(60));
}

TEST_F(RootCauseAnalyzerTest, EmptyGraphMeansNoData) {
    auto report = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10)}),
                          graph::ServiceGraph{});

    EXPECT_TRUE(report.root_causes.empty());
    EXPECT_EQ(report.services_analyzed, 0u);
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_NE(report.diagnostics[0].find("no data to analyze"), std::string::npos);
}

TEST_F(RootCauseAnalyzerTest, UnmappedServicesReported) {
    auto report = Analyze(Detection({MakeAnomaly("C", Priority::kHigh, 10),
                                     MakeAnomaly("ghost", Priority::kHigh, 10)}),
                          chain_);

    ASSERT_EQ(report.root_causes.size(), 1u);
    EXPECT_EQ(report.services_analyzed, 1u);
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_NE(report.diagnostics[0].find("ghost"), std::string::npos);

    auto only_ghost = Analyze(Detection({MakeAnomaly("ghost", Priority::kHigh, 10)}), chain_);
    EXPECT_EQ(only_ghost.services_analyzed, 0u);
    EXPECT_NE(only_ghost.diagnostics.back().find("no data to analyze"), std::string::npos);
}

TEST(RootCauseAnalyzerConfigTest, InvalidConfigRejected) {
    RootCauseAnalyzerConfig config;
    config.max_depth = 0;
    RootCauseAnalyzer analyzer(config);

    auto report = analyzer.Analyze(DetectionResult{}, graph::ServiceGraph{});
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.status().code(), absl::StatusCode::kInvalidArgument);

    RootCauseAnalyzerConfig negative;
    negative.correlation_threshold = -1.0;
    EXPECT_FALSE(negative.Validate().ok());

    RootCauseAnalyzerConfig no_window;
    no_window.time_correlation_window = std::chrono::minutes(0);
    EXPECT_FALSE(no_window.Validate().ok());

    EXPECT_TRUE(RootCauseAnalyzerConfig{}.Validate().ok());
}

TEST(RootCauseScoringTest, ConfidenceGrowsWithCorroboration) {
    double alone = ComputeConfidence(1, 0, 0.0);
    double one = ComputeConfidence(1, 1, 1.0);
    double many = ComputeConfidence(3, 5, 1.0);

    EXPECT_NEAR(alone, 0.2 + 0.2 / 3.0, 1e-12);
    EXPECT_LT(alone, one);
    EXPECT_LT(one, many);
    EXPECT_LE(many, 1.0);
    EXPECT_LT(ComputeConfidence(1, 2, 0.0), ComputeConfidence(1, 2, 1.0));
}

TEST(RootCauseScoringTest, RecommendationCoversAnomalyKinds) {
    RootCauseCandidate candidate;
    candidate.root_service = "db";
    candidate.root_service_name = "mysql";
    candidate.anomalies = {MakeAnomaly("db", Priority::kHigh, 0),
                           MakeAnomaly("db", Priority::kHigh, 0, AnomalyKind::kErrorRateSpike)};
    candidate.impact_analysis.impact_severity = ImpactSeverity::kHigh;
    candidate.impact_analysis.affected_services.resize(3);

    std::string text = BuildRecommendation(candidate);

    EXPECT_NE(text.find("error logs of mysql"), std::string::npos);
    EXPECT_NE(text.find("Profile mysql"), std::string::npos);
    EXPECT_NE(text.find("3 downstream services"), std::string::npos);
    EXPECT_NE(text.find("Immediate action"), std::string::npos);

    RootCauseCandidate bare;
    bare.root_service = "svc";
    EXPECT_EQ(BuildRecommendation(bare), "Investigate the anomalies of svc further");
}

TEST(RootCauseScoringTest, SeverityNames) {
    EXPECT_EQ(ImpactSeverityToString(ImpactSeverity::kHigh), "HIGH");
    EXPECT_EQ(ImpactSeverityFromString("MEDIUM"), ImpactSeverity::kMedium);
    EXPECT_FALSE(ImpactSeverityFromString("medium").has_value());
}

}  // namespace
}  // namespace skyrca::rca
