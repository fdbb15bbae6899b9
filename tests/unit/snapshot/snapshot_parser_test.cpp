/// @file snapshot_parser_test.cpp
/// @brief Tests for the snapshot JSON reader and file source

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "snapshot/snapshot_parser.h"
#include "snapshot/snapshot_source.h"

namespace skyrca::snapshot {
namespace {

using json = nlohmann::json;

// 2024-05-01T10:00:00Z
constexpr int64_t kBaseMillis = 1714557600000;

TEST(ParseTimestampTest, AcceptsEpochSecondsAndMillis) {
    auto seconds = ParseTimestamp(json(1714557600));
    auto millis = ParseTimestamp(json(kBaseMillis));
    auto text = ParseTimestamp(json("1714557600"));

    ASSERT_TRUE(seconds.ok());
    ASSERT_TRUE(millis.ok());
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(ToEpochMillis(*seconds), kBaseMillis);
    EXPECT_EQ(ToEpochMillis(*millis), kBaseMillis);
    EXPECT_EQ(ToEpochMillis(*text), kBaseMillis);
}

TEST(ParseTimestampTest, AcceptsIsoAndMinuteFormats) {
    auto with_offset = ParseTimestamp(json("2024-05-01T12:00:00+02:00"));
    auto naive = ParseTimestamp(json("2024-05-01T10:00:00"));
    auto fractional = ParseTimestamp(json("2024-05-01T10:00:00.250Z"));
    auto minute = ParseTimestamp(json("2024-05-01 1000"));

    ASSERT_TRUE(with_offset.ok());
    ASSERT_TRUE(naive.ok());
    ASSERT_TRUE(fractional.ok());
    ASSERT_TRUE(minute.ok());
    EXPECT_EQ(ToEpochMillis(*with_offset), kBaseMillis);
    EXPECT_EQ(ToEpochMillis(*naive), kBaseMillis);
    EXPECT_EQ(ToEpochMillis(*fractional), kBaseMillis + 250);
    EXPECT_EQ(ToEpochMillis(*minute), kBaseMillis);
}

TEST(ParseTimestampTest, RejectsGarbage) {
    EXPECT_FALSE(ParseTimestamp(json("yesterday")).ok());
    EXPECT_FALSE(ParseTimestamp(json::array()).ok());
}

TEST(ParseTimestampTest, RejectsOutOfRangeEpochs) {
    EXPECT_FALSE(ParseTimestamp(json("nan")).ok());
    EXPECT_FALSE(ParseTimestamp(json("inf")).ok());
    EXPECT_FALSE(ParseTimestamp(json(1e20)).ok());
    EXPECT_FALSE(ParseTimestamp(json(-1e14)).ok());

    auto result = ParseTimestamp(json(1e20));
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParseTimestampTest, DropsSubMillisecondPrecision) {
    auto parsed = ParseTimestamp(json("2024-05-01T10:00:00.250999Z"));
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(*parsed, FromEpochMillis(kBaseMillis + 250));
}

TEST(SnapshotParserTest, ParsesFullDocument) {
    const char* content = R"({
        "timestamp": "2024-05-01T10:00:00Z",
        "topology": {
            "nodes": [
                {"id": "gw", "name": "gateway", "type": "Tomcat", "isReal": true},
                {"id": "db", "name": "mysql", "type": "MySQL", "isReal": false}
            ],
            "calls": [{"source": "gw", "target": "db"}]
        },
        "services": [{
            "service": {"id": "gw", "name": "gateway"},
            "metrics": {
                "service_resp_time": {"values": {"values": [{"value": 10}, {"value": null}, {"value": 30}]}},
                "service_cpm": {"values": [{"values": [{"value": "5"}, {"value": 7}]}]}
            },
            "traces": [
                {"segmentId": "s1", "duration": 120, "start": "1714557540000", "isError": true}
            ],
            "instances": [{"id": "i1", "name": "gateway-0"}]
        }]
    })";

    auto result = ParseSnapshotString(content);
    ASSERT_TRUE(result.ok()) << result.status().message();
    const Snapshot& snapshot = *result;

    EXPECT_EQ(ToEpochMillis(snapshot.timestamp), kBaseMillis);
    ASSERT_EQ(snapshot.topology.nodes.size(), 2u);
    EXPECT_FALSE(snapshot.topology.nodes[1].is_real);
    ASSERT_EQ(snapshot.topology.calls.size(), 1u);
    EXPECT_EQ(snapshot.topology.calls[0].source, "gw");

    ASSERT_EQ(snapshot.services.size(), 1u);
    const auto& service = snapshot.services[0];
    EXPECT_EQ(service.service_id, "gw");
    EXPECT_EQ(service.service_name, "gateway");

    const auto& latency = service.metrics.at("service_resp_time");
    EXPECT_EQ(latency.kind, MetricKind::kLatency);
    ASSERT_EQ(latency.samples.size(), 2u);  // null skipped
    EXPECT_DOUBLE_EQ(latency.samples[0].value, 10.0);
    EXPECT_DOUBLE_EQ(latency.samples[1].value, 30.0);
    // Untimed samples end at the snapshot timestamp, one minute apart
    EXPECT_EQ(ToEpochMillis(latency.samples[1].timestamp), kBaseMillis);
    EXPECT_EQ(ToEpochMillis(latency.samples[0].timestamp), kBaseMillis - 2 * 60000);

    const auto& throughput = service.metrics.at("service_cpm");
    EXPECT_EQ(throughput.kind, MetricKind::kThroughput);
    ASSERT_EQ(throughput.samples.size(), 2u);
    EXPECT_DOUBLE_EQ(throughput.samples[0].value, 5.0);

    ASSERT_EQ(service.traces.size(), 1u);
    EXPECT_EQ(service.traces[0].segment_id, "s1");
    EXPECT_DOUBLE_EQ(service.traces[0].duration_ms, 120.0);
    EXPECT_TRUE(service.traces[0].is_error);
    EXPECT_EQ(ToEpochMillis(service.traces[0].start), kBaseMillis - 60000);

    ASSERT_EQ(service.instances.size(), 1u);
    EXPECT_EQ(service.instances[0].name, "gateway-0");
}

TEST(SnapshotParserTest, SpreadSamplesLandOnWholeMilliseconds) {
    json values = json::array();
    for (int i = 0; i < 14; ++i) {
        values.push_back({{"value", 100 + i}});
    }
    json doc = {
        {"time_range", {{"start", "2024-05-01 1000"}, {"end", "2024-05-01 1100"}}},
        {"services", {{
            {"service", {{"id", "svc"}, {"name", "svc"}}},
            {"metrics", {{"service_resp_time", {{"values", {{"values", values}}}}}}}
        }}}
    };

    auto result = ParseSnapshot(doc);
    ASSERT_TRUE(result.ok()) << result.status().message();

    const auto& samples = result->services[0].metrics.at("service_resp_time").samples;
    ASSERT_EQ(samples.size(), 14u);
    for (const auto& sample : samples) {
        EXPECT_EQ(sample.timestamp, FromEpochMillis(ToEpochMillis(sample.timestamp)));
    }
    // 3600 s * 10 / 13
    EXPECT_EQ(ToEpochMillis(samples[10].timestamp), kBaseMillis + 2769230);
}

TEST(SnapshotParserTest, SpreadsUntimedSamplesOverTimeRange) {
    const char* content = R"({
        "time_range": {"start": "2024-05-01 1000", "end": "2024-05-01 1010"},
        "services": [{
            "service": {"id": "svc", "name": "svc"},
            "metrics": {"service_sla": {"values": {"values": [{"value": 9900}, {"value": 9800}, {"value": 9700}]}}}
        }]
    })";

    auto result = ParseSnapshotString(content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    ASSERT_TRUE(result->time_range.has_value());
    EXPECT_EQ(ToEpochMillis(result->timestamp), kBaseMillis + 10 * 60000);

    const auto& sla = result->services[0].metrics.at("service_sla");
    EXPECT_EQ(sla.kind, MetricKind::kSuccessRate);
    ASSERT_EQ(sla.samples.size(), 3u);
    EXPECT_EQ(ToEpochMillis(sla.samples[0].timestamp), kBaseMillis);
    EXPECT_EQ(ToEpochMillis(sla.samples[1].timestamp), kBaseMillis + 5 * 60000);
    EXPECT_EQ(ToEpochMillis(sla.samples[2].timestamp), kBaseMillis + 10 * 60000);
}

TEST(SnapshotParserTest, ExplicitSampleTimestampsAreSorted) {
    json document = {
        {"services", json::array({{
            {"service", {{"id", "svc"}}},
            {"metrics", {{"service_resp_time", {{"values", {{"values", json::array({
                {{"value", 2}, {"timestamp", kBaseMillis + 60000}},
                {{"value", 1}, {"timestamp", kBaseMillis}},
            })}}}}}}},
        }})},
    };

    auto result = ParseSnapshot(document);
    ASSERT_TRUE(result.ok()) << result.status().message();

    const auto& samples = result->services[0].metrics.at("service_resp_time").samples;
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_DOUBLE_EQ(samples[0].value, 1.0);
    EXPECT_DOUBLE_EQ(samples[1].value, 2.0);
    // Without an explicit timestamp the latest observation anchors the snapshot
    EXPECT_EQ(ToEpochMillis(result->timestamp), kBaseMillis + 60000);
}

TEST(SnapshotParserTest, NonNumericSampleMarksSeriesMalformed) {
    const char* content = R"({
        "services": [{
            "service": {"id": "svc"},
            "metrics": {"service_resp_time": {"values": {"values": [{"value": 1}, {"value": "fast"}]}}}
        }]
    })";

    auto result = ParseSnapshotString(content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    const auto& series = result->services[0].metrics.at("service_resp_time");
    EXPECT_TRUE(series.IsMalformed());
    EXPECT_TRUE(series.samples.empty());
}

TEST(SnapshotParserTest, RecoversFromBadEntriesWithWarnings) {
    const char* content = R"({
        "topology": {
            "nodes": [{"name": "only-name"}, {}, 5],
            "calls": [{"source": "only-name"}]
        },
        "services": [
            {"service": {}},
            {"service": {"id": "svc"}, "traces": [{"segmentId": "t1", "start": 0}, {"traceIds": ["t2"], "duration": 5}]}
        ]
    })";

    auto result = ParseSnapshotString(content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    ASSERT_EQ(result->topology.nodes.size(), 1u);
    EXPECT_EQ(result->topology.nodes[0].id, "only-name");
    EXPECT_TRUE(result->topology.calls.empty());
    ASSERT_EQ(result->services.size(), 1u);
    EXPECT_TRUE(result->services[0].traces.empty());
    EXPECT_GE(result->warnings.size(), 5u);
}

TEST(SnapshotParserTest, RejectsStructuralErrors) {
    EXPECT_FALSE(ParseSnapshotString("[1, 2, 3]").ok());
    EXPECT_FALSE(ParseSnapshotString(R"({"services": {}})").ok());
    EXPECT_FALSE(ParseSnapshotString(R"({"topology": {"nodes": 3}})").ok());
    EXPECT_FALSE(ParseSnapshotString(R"({"timestamp": "not a time"})").ok());
    EXPECT_FALSE(ParseSnapshotString("{ not json").ok());
}

TEST(SnapshotParserTest, EmptyDocument) {
    auto result = ParseSnapshotString("{}");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->services.empty());
    EXPECT_TRUE(result->topology.nodes.empty());
    EXPECT_EQ(ToEpochMillis(result->timestamp), 0);
}

TEST(FileSnapshotSourceTest, ReadsFile) {
    auto path = std::filesystem::temp_directory_path() / "skyrca_snapshot_source_test.json";
    {
        std::ofstream file(path);
        file << R"({"timestamp": 1714557600, "services": [{"service": {"id": "a"}}]})";
    }

    FileSnapshotSource source(path);
    auto result = source.Fetch();
    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->services.size(), 1u);
    EXPECT_NE(source.Describe().find("skyrca_snapshot_source_test.json"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(FileSnapshotSourceTest, MissingFile) {
    FileSnapshotSource source("/nonexistent/snapshot.json");
    auto result = source.Fetch();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace skyrca::snapshot
