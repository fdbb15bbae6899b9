#pragma once

/// @file metrics.h
/// @brief SkyRCA internal metrics collection for self-monitoring

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace skyrca {

/// @brief A monotonically increasing counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    /// @brief Increment the counter by 1
    void Increment();

    /// @brief Increment the counter by a specific amount
    /// @param delta Amount to add (negative values are ignored)
    void Add(int64_t delta);

    int64_t Value() const;
    void Reset();

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief A histogram for measuring value distributions
class Histogram {
public:
    /// @brief Create a histogram with default buckets (seconds)
    explicit Histogram(std::string name, std::string description = "");

    /// @brief Create a histogram with custom buckets
    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    /// @brief Record a value
    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative bucket counts, last entry is the +Inf bucket
    std::vector<std::pair<double, int64_t>> Buckets() const;

    void Reset();

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;
    std::vector<std::atomic<int64_t>> bucket_counts_;
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief RAII timer recording elapsed seconds into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide registry owning every metric
///
/// Metrics are never removed once registered, so references returned by
/// the getters stay valid for the life of the process.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    /// @brief Register or get an existing counter
    Counter& GetCounter(const std::string& name, const std::string& description = "");

    /// @brief Register or get an existing histogram
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Export all metrics in Prometheus text format, sorted by name
    std::string ExportText() const;

    /// @brief Zero every metric (primarily for testing)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define SKYRCA_COUNTER(name) \
    ::skyrca::MetricsRegistry::Instance().GetCounter(name)

#define SKYRCA_HISTOGRAM(name) \
    ::skyrca::MetricsRegistry::Instance().GetHistogram(name)

#define SKYRCA_TIMER(histogram) \
    ::skyrca::ScopedTimer SKYRCA_METRICS_CONCAT(_timer_, __LINE__)(histogram)

#define SKYRCA_METRICS_CONCAT(a, b) SKYRCA_METRICS_CONCAT_IMPL(a, b)
#define SKYRCA_METRICS_CONCAT_IMPL(a, b) a##b

}  // namespace skyrca
