/// @file anomaly_detector.cpp
/// @brief Anomaly detection implementation

#include "detector/anomaly_detector.h"

#include <algorithm>
#include <cmath>
#include <map>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "common/thread_pool.h"

namespace skyrca::detector {

using snapshot::MetricKind;
using snapshot::MetricSample;
using snapshot::MetricSeries;

namespace {

double Mean(const std::vector<MetricSample>& samples, size_t begin, size_t end) {
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum += samples[i].value;
    }
    return sum / static_cast<double>(end - begin);
}

/// Population standard deviation
double StdDev(const std::vector<MetricSample>& samples, size_t begin, size_t end, double mean) {
    double sum_sq = 0.0;
    for (size_t i = begin; i < end; ++i) {
        double diff = samples[i].value - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(end - begin));
}

/// +1 when growth is abnormal, -1 when decline is
double Direction(MetricKind kind) {
    return kind == MetricKind::kThroughput ? -1.0 : 1.0;
}

std::string_view Unit(MetricKind kind) {
    switch (kind) {
        case MetricKind::kLatency: return " ms";
        case MetricKind::kErrorRate:
        case MetricKind::kSuccessRate: return "%";
        case MetricKind::kThroughput: return " cpm";
        case MetricKind::kUnknown: return "";
    }
    return "";
}

std::string_view Headline(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::kLatencySpike: return "Latency spike";
        case AnomalyKind::kErrorRateSpike: return "Error rate spike";
        case AnomalyKind::kThroughputDrop: return "Throughput drop";
        case AnomalyKind::kThroughputUnstable: return "Unstable throughput";
    }
    return "Anomaly";
}

/// Success rates become error percentages; basis points (SLA 10000 = 100%) are scaled first
MetricSeries ToErrorRate(const MetricSeries& series) {
    MetricSeries converted = series;
    converted.kind = MetricKind::kErrorRate;

    double max_value = 0.0;
    for (const auto& sample : series.samples) {
        max_value = std::max(max_value, sample.value);
    }
    double divisor = max_value > 100.0 ? 100.0 : 1.0;
    for (auto& sample : converted.samples) {
        sample.value = 100.0 - sample.value / divisor;
    }
    return converted;
}

int64_t FloorDiv(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

}  // namespace

std::string_view DetectionAlgorithmToString(DetectionAlgorithm algorithm) {
    switch (algorithm) {
        case DetectionAlgorithm::kThreshold: return "threshold";
        case DetectionAlgorithm::kZScore: return "z_score";
        case DetectionAlgorithm::kVariability: return "variability";
    }
    return "unknown";
}

absl::StatusOr<std::vector<DetectionAlgorithm>> ParseDetectionAlgorithms(
    const std::vector<std::string>& names) {
    std::vector<DetectionAlgorithm> algorithms;
    auto add = [&algorithms](DetectionAlgorithm algorithm) {
        if (std::find(algorithms.begin(), algorithms.end(), algorithm) == algorithms.end()) {
            algorithms.push_back(algorithm);
        }
    };

    for (const auto& name : names) {
        if (name == "threshold" || name == "statistical") {
            add(DetectionAlgorithm::kThreshold);
        } else if (name == "z_score") {
            add(DetectionAlgorithm::kZScore);
        } else if (name == "variability") {
            add(DetectionAlgorithm::kVariability);
        } else if (name == "isolation_forest") {
            SKYRCA_LOG_WARN("Detection algorithm 'isolation_forest' is not supported, ignoring");
        } else {
            return ConfigurationError(absl::StrCat("Unknown detection algorithm '", name, "'"));
        }
    }
    return algorithms;
}

absl::Status AnomalyDetectorConfig::Validate() const {
    if (!std::isfinite(response_time_threshold_ms) || response_time_threshold_ms <= 0.0) {
        return ConfigurationError(absl::StrCat(
            "response_time_threshold must be positive, got ", response_time_threshold_ms));
    }
    if (!std::isfinite(error_rate_threshold) || error_rate_threshold < 0.0 ||
        error_rate_threshold > 100.0) {
        return ConfigurationError(absl::StrCat(
            "error_rate_threshold must be within [0, 100], got ", error_rate_threshold));
    }
    if (!std::isfinite(throughput_drop_threshold) || throughput_drop_threshold <= 0.0 ||
        throughput_drop_threshold > 100.0) {
        return ConfigurationError(absl::StrCat(
            "throughput_drop_threshold must be within (0, 100], got ", throughput_drop_threshold));
    }
    if (time_window.count() <= 0) {
        return ConfigurationError(absl::StrCat(
            "time_window must be positive, got ", time_window.count()));
    }
    if (algorithms.empty()) {
        return ConfigurationError("At least one detection algorithm must be enabled");
    }
    if (!std::isfinite(z_score_threshold) || z_score_threshold <= 0.0) {
        return ConfigurationError(absl::StrCat(
            "z_score_threshold must be positive, got ", z_score_threshold));
    }
    if (!std::isfinite(marginal_z_score) || marginal_z_score <= 0.0 ||
        marginal_z_score > z_score_threshold) {
        return ConfigurationError(absl::StrCat(
            "marginal_z_score must be within (0, z_score_threshold], got ", marginal_z_score));
    }
    if (!std::isfinite(recent_fraction) || recent_fraction <= 0.0 || recent_fraction >= 1.0) {
        return ConfigurationError(absl::StrCat(
            "recent_fraction must be within (0, 1), got ", recent_fraction));
    }
    if (min_baseline_samples == 0) {
        return ConfigurationError("min_baseline_samples must be at least 1");
    }
    if (!std::isfinite(throughput_cv_threshold) || throughput_cv_threshold <= 0.0) {
        return ConfigurationError(absl::StrCat(
            "throughput_cv_threshold must be positive, got ", throughput_cv_threshold));
    }
    if (trace_bucket.count() <= 0) {
        return ConfigurationError(absl::StrCat(
            "trace_bucket must be positive, got ", trace_bucket.count()));
    }
    if (worker_threads == 0) {
        return ConfigurationError("worker_threads must be at least 1");
    }
    return absl::OkStatus();
}

bool AnomalyDetectorConfig::IsEnabled(DetectionAlgorithm algorithm) const {
    return std::find(algorithms.begin(), algorithms.end(), algorithm) != algorithms.end();
}

std::vector<MetricSeries> BuildTraceSeries(const std::vector<snapshot::TraceRecord>& traces,
                                           std::chrono::minutes bucket) {
    int64_t width_ms = std::chrono::duration_cast<std::chrono::milliseconds>(bucket).count();
    if (traces.empty() || width_ms <= 0) {
        return {};
    }

    struct BucketTotals {
        double duration_sum = 0.0;
        size_t count = 0;
        size_t errors = 0;
    };
    std::map<int64_t, BucketTotals> buckets;
    std::string invalid_duration;
    for (const auto& trace : traces) {
        if (invalid_duration.empty() &&
            (!std::isfinite(trace.duration_ms) || trace.duration_ms < 0.0)) {
            invalid_duration = absl::StrCat("trace ", trace.segment_id,
                                            " has invalid duration ", trace.duration_ms);
        }
        auto& totals = buckets[FloorDiv(snapshot::ToEpochMillis(trace.start), width_ms)];
        totals.duration_sum += trace.duration_ms;
        ++totals.count;
        if (trace.is_error) {
            ++totals.errors;
        }
    }

    MetricSeries error_rate;
    error_rate.name = "trace_error_rate";
    error_rate.kind = MetricKind::kErrorRate;

    MetricSeries latency;
    latency.name = "trace_latency";
    latency.kind = MetricKind::kLatency;
    latency.malformed_reason = std::move(invalid_duration);

    for (const auto& [index, totals] : buckets) {
        auto ts = snapshot::FromEpochMillis(index * width_ms);
        double count = static_cast<double>(totals.count);
        error_rate.samples.push_back(
            MetricSample{ts, 100.0 * static_cast<double>(totals.errors) / count});
        latency.samples.push_back(MetricSample{ts, totals.duration_sum / count});
    }

    return {std::move(error_rate), std::move(latency)};
}

AnomalyDetector::AnomalyDetector(AnomalyDetectorConfig config)
    : config_(std::move(config)) {}

AnomalyDetector::~AnomalyDetector() = default;

absl::StatusOr<DetectionResult> AnomalyDetector::Detect(const snapshot::Snapshot& snapshot,
                                                        const graph::ServiceGraph& graph) {
    SKYRCA_RETURN_IF_ERROR(config_.Validate());

    const auto& services = snapshot.services;
    auto outcomes = ParallelMap(services.size(), config_.worker_threads,
        [this, &services, &graph](size_t i) {
            return DetectService(services[i], graph);
        });

    DetectionResult result;
    result.detection_timestamp = snapshot.timestamp;
    result.metrics_summary.total_services = services.size();

    size_t series_evaluated = 0;
    size_t series_malformed = 0;
    for (auto& outcome : outcomes) {
        if (!outcome.anomalies.empty()) {
            ++result.metrics_summary.services_with_anomalies;
        }
        for (auto& anomaly : outcome.anomalies) {
            result.anomalies.Add(std::move(anomaly));
        }
        result.diagnostics.insert(result.diagnostics.end(),
                                  std::make_move_iterator(outcome.diagnostics.begin()),
                                  std::make_move_iterator(outcome.diagnostics.end()));
        series_evaluated += outcome.series_evaluated;
        series_malformed += outcome.series_malformed;
    }

    size_t anomaly_count = result.anomalies.Size();
    SKYRCA_COUNTER("skyrca.detector.series_evaluated").Add(static_cast<int64_t>(series_evaluated));
    SKYRCA_COUNTER("skyrca.detector.series_malformed").Add(static_cast<int64_t>(series_malformed));
    SKYRCA_COUNTER("skyrca.detector.anomalies").Add(static_cast<int64_t>(anomaly_count));

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.passes;
        stats_.series_evaluated += series_evaluated;
        stats_.series_malformed += series_malformed;
        stats_.anomalies_detected += anomaly_count;
    }

    SKYRCA_LOG_INFO("Detection: {} services, {} series, {} anomalies "
                    "(high {}, medium {}, low {})",
                    services.size(), series_evaluated, anomaly_count,
                    result.anomalies.high.size(), result.anomalies.medium.size(),
                    result.anomalies.low.size());

    return result;
}

AnomalyDetector::ServiceOutcome AnomalyDetector::DetectService(
    const snapshot::ServiceMetrics& service, const graph::ServiceGraph& graph) const {
    ServiceOutcome outcome;

    std::optional<std::string> resolved;
    if (!service.service_id.empty()) {
        resolved = graph.ResolveId(service.service_id);
    }
    if (!resolved && !service.service_name.empty()) {
        resolved = graph.ResolveId(service.service_name);
    }

    ServiceRef ref;
    ref.id = resolved.value_or(service.Key());
    ref.name = service.service_name.empty() ? ref.id : service.service_name;
    if (!resolved) {
        outcome.diagnostics.push_back(
            absl::StrCat("Service '", service.Key(), "' not found in topology"));
    }

    // Reported metrics and trace aggregates, evaluated in name order
    std::vector<MetricSeries> trace_series = BuildTraceSeries(service.traces, config_.trace_bucket);
    std::map<std::string, const MetricSeries*> series_by_name;
    for (const auto& [name, series] : service.metrics) {
        series_by_name.emplace(name, &series);
    }
    for (const auto& series : trace_series) {
        series_by_name.emplace(series.name, &series);
    }

    for (const auto& [name, series] : series_by_name) {
        if (series->kind == MetricKind::kUnknown) {
            SKYRCA_LOG_DEBUG("Service {}: skipping metric {} of unknown kind", ref.name, name);
            continue;
        }
        if (series->Empty() && !series->IsMalformed()) {
            continue;
        }

        auto status = EvaluateSeries(ref, *series, outcome.anomalies);
        if (!status.ok()) {
            ++outcome.series_malformed;
            std::string diagnostic = absl::StrCat(
                "Service '", ref.name, "' metric '", name, "' skipped: ", status.message());
            SKYRCA_LOG_WARN("{}", diagnostic);
            outcome.diagnostics.push_back(std::move(diagnostic));
            continue;
        }
        ++outcome.series_evaluated;
    }

    SKYRCA_LOG_DEBUG("Service {}: {} series evaluated, {} anomalies",
                     ref.name, outcome.series_evaluated, outcome.anomalies.size());
    return outcome;
}

absl::Status AnomalyDetector::EvaluateSeries(const ServiceRef& service,
                                             const MetricSeries& series,
                                             std::vector<Anomaly>& anomalies) const {
    if (series.IsMalformed()) {
        return MakeError(ErrorCode::kMalformedSnapshot, series.malformed_reason);
    }

    for (const auto& sample : series.samples) {
        if (!std::isfinite(sample.value)) {
            return MakeError(ErrorCode::kValidationError, "non-finite sample value");
        }
        if (sample.value < 0.0) {
            return MakeError(ErrorCode::kValidationError, absl::StrCat(
                "negative ", std::string(snapshot::MetricKindToString(series.kind)), " value ", sample.value));
        }
    }

    MetricSeries prepared = series.kind == MetricKind::kSuccessRate ? ToErrorRate(series) : series;
    if (series.kind == MetricKind::kSuccessRate) {
        for (const auto& sample : prepared.samples) {
            if (sample.value < 0.0) {
                return MakeError(ErrorCode::kValidationError, "success rate above 100%");
            }
        }
    }

    auto cutoff = prepared.samples.back().timestamp - config_.time_window;
    std::vector<MetricSample> windowed;
    windowed.reserve(prepared.samples.size());
    for (const auto& sample : prepared.samples) {
        if (sample.timestamp >= cutoff) {
            windowed.push_back(sample);
        }
    }

    if (config_.IsEnabled(DetectionAlgorithm::kThreshold) ||
        config_.IsEnabled(DetectionAlgorithm::kZScore)) {
        if (auto anomaly = CheckLevel(service, prepared, windowed)) {
            anomalies.push_back(std::move(*anomaly));
        }
    }

    if (prepared.kind == MetricKind::kThroughput &&
        config_.IsEnabled(DetectionAlgorithm::kVariability)) {
        if (auto anomaly = CheckVariability(service, prepared, windowed)) {
            anomalies.push_back(std::move(*anomaly));
        }
    }

    return absl::OkStatus();
}

std::optional<Anomaly> AnomalyDetector::CheckLevel(
    const ServiceRef& service, const MetricSeries& series,
    const std::vector<MetricSample>& samples) const {
    const size_t n = samples.size();
    size_t recent_count = static_cast<size_t>(
        std::ceil(static_cast<double>(n) * config_.recent_fraction));
    recent_count = std::clamp<size_t>(recent_count, 1, n);
    const size_t baseline_count = n - recent_count;

    const double observed = Mean(samples, baseline_count, n);
    std::optional<double> baseline_mean;
    double baseline_std = 0.0;
    if (baseline_count > 0) {
        baseline_mean = Mean(samples, 0, baseline_count);
        baseline_std = StdDev(samples, 0, baseline_count, *baseline_mean);
    }

    const double direction = Direction(series.kind);

    AnomalyKind kind = AnomalyKind::kLatencySpike;
    double threshold = 0.0;
    bool threshold_violated = false;
    switch (series.kind) {
        case MetricKind::kLatency:
            kind = AnomalyKind::kLatencySpike;
            threshold = config_.response_time_threshold_ms;
            threshold_violated = observed > threshold;
            break;
        case MetricKind::kErrorRate:
        case MetricKind::kSuccessRate:
            kind = AnomalyKind::kErrorRateSpike;
            threshold = config_.error_rate_threshold;
            threshold_violated = observed > threshold;
            break;
        case MetricKind::kThroughput:
            kind = AnomalyKind::kThroughputDrop;
            if (baseline_mean && *baseline_mean > 0.0) {
                threshold = (1.0 - config_.throughput_drop_threshold / 100.0) * *baseline_mean;
                threshold_violated = observed < threshold;
            }
            break;
        case MetricKind::kUnknown:
            return std::nullopt;
    }
    threshold_violated = threshold_violated && config_.IsEnabled(DetectionAlgorithm::kThreshold);

    double z_score = 0.0;
    bool statistical_violated = false;
    bool marginal = false;
    if (config_.IsEnabled(DetectionAlgorithm::kZScore) && baseline_mean &&
        baseline_count >= config_.min_baseline_samples) {
        double floored_std = std::max({baseline_std, 0.01 * std::abs(*baseline_mean), 1e-6});
        z_score = direction * (observed - *baseline_mean) / floored_std;
        statistical_violated = z_score >= config_.z_score_threshold;
        marginal = !statistical_violated && z_score >= config_.marginal_z_score;
    }

    Priority priority;
    if (threshold_violated && statistical_violated) {
        priority = Priority::kHigh;
    } else if (threshold_violated || statistical_violated) {
        priority = Priority::kMedium;
    } else if (marginal) {
        priority = Priority::kLow;
    } else {
        return std::nullopt;
    }

    // Report the recent sample that deviates furthest in the abnormal direction
    const double reference = baseline_mean.value_or(0.0);
    size_t peak = baseline_count;
    for (size_t i = baseline_count + 1; i < n; ++i) {
        if (direction * (samples[i].value - reference) >
            direction * (samples[peak].value - reference)) {
            peak = i;
        }
    }

    Anomaly anomaly;
    anomaly.service_id = service.id;
    anomaly.service_name = service.name;
    anomaly.metric_name = series.name;
    anomaly.kind = kind;
    anomaly.priority = priority;
    anomaly.observed_value = observed;
    anomaly.baseline_value = baseline_mean.value_or(observed);
    anomaly.threshold = threshold;
    anomaly.deviation = z_score;
    anomaly.threshold_violated = threshold_violated;
    anomaly.statistical_violated = statistical_violated;
    anomaly.timestamp = samples[peak].timestamp;

    const std::string_view unit = Unit(series.kind);
    anomaly.description = absl::StrFormat(
        "%s on %s (%s): observed %.2f%s, baseline %.2f%s, limit %.2f%s, z-score %.2f",
        Headline(kind), service.name, series.name, observed, unit,
        anomaly.baseline_value, unit, threshold, unit, z_score);

    return anomaly;
}

std::optional<Anomaly> AnomalyDetector::CheckVariability(
    const ServiceRef& service, const MetricSeries& series,
    const std::vector<MetricSample>& samples) const {
    const size_t n = samples.size();
    if (n < 2) {
        return std::nullopt;
    }

    const double mean = Mean(samples, 0, n);
    if (mean <= 0.0) {
        return std::nullopt;
    }
    const double cv = StdDev(samples, 0, n, mean) / mean;
    if (cv <= config_.throughput_cv_threshold) {
        return std::nullopt;
    }

    size_t peak = 0;
    for (size_t i = 1; i < n; ++i) {
        if (std::abs(samples[i].value - mean) > std::abs(samples[peak].value - mean)) {
            peak = i;
        }
    }

    Anomaly anomaly;
    anomaly.service_id = service.id;
    anomaly.service_name = service.name;
    anomaly.metric_name = series.name;
    anomaly.kind = AnomalyKind::kThroughputUnstable;
    anomaly.priority = Priority::kMedium;
    anomaly.observed_value = cv;
    anomaly.baseline_value = mean;
    anomaly.threshold = config_.throughput_cv_threshold;
    anomaly.deviation = cv;
    anomaly.threshold_violated = true;
    anomaly.statistical_violated = false;
    anomaly.timestamp = samples[peak].timestamp;
    anomaly.description = absl::StrFormat(
        "%s on %s (%s): coefficient of variation %.2f exceeds %.2f around mean %.2f cpm",
        Headline(anomaly.kind), service.name, series.name, cv,
        config_.throughput_cv_threshold, mean);

    return anomaly;
}

AnomalyDetector::Stats AnomalyDetector::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void AnomalyDetector::ResetStats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

std::unique_ptr<AnomalyDetector> CreateAnomalyDetector(AnomalyDetectorConfig config) {
    return std::make_unique<AnomalyDetector>(std::move(config));
}

}  // namespace skyrca::detector
