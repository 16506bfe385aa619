/**
 * @file metrics.hpp
 * @brief Metrics sink interface and the in-process collector.
 */

#ifndef TEXHARVEST_METRICS_HPP
#define TEXHARVEST_METRICS_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace texharvest {

using MetricTags = std::map<std::string, std::string>;

/**
 * @brief Destination for counters and timings emitted by the pipeline.
 *
 * Stages receive a reference to a sink and never care what is behind it.
 */
struct IMetricsSink {
    virtual ~IMetricsSink() = default;

    virtual void increment(std::string_view name, const MetricTags& tags = {}, std::int64_t value = 1) = 0;
    virtual void observe(std::string_view name, std::chrono::milliseconds duration) = 0;
    virtual void gauge(std::string_view name, double value) = 0;
};

/**
 * @brief Aggregate statistics of one timer.
 */
struct TimerStats {
    std::uint64_t count = 0;
    double avg_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
};

/**
 * @brief Point-in-time copy of everything a MetricsCollector has seen.
 *
 * Counter keys are the metric name, optionally followed by the tags in
 * "name{key=value,...}" form.
 */
struct MetricsSnapshot {
    std::map<std::string, std::int64_t> counters;
    std::map<std::string, TimerStats> timers;
    std::map<std::string, double> gauges;
};

/**
 * @brief Thread-safe in-memory IMetricsSink.
 */
class MetricsCollector final : public IMetricsSink {
public:
    void increment(std::string_view name, const MetricTags& tags = {}, std::int64_t value = 1) override;
    void observe(std::string_view name, std::chrono::milliseconds duration) override;
    void gauge(std::string_view name, double value) override;

    [[nodiscard]] MetricsSnapshot snapshot() const;

    /// @return Counter value for an exact key, 0 if never incremented.
    [[nodiscard]] std::int64_t counter(const std::string& key) const;

private:
    struct TimerAccum {
        std::uint64_t count = 0;
        double sum_ms = 0.0;
        double min_ms = 0.0;
        double max_ms = 0.0;
    };

    mutable std::mutex mtx_;
    std::map<std::string, std::int64_t> counters_;
    std::map<std::string, TimerAccum> timers_;
    std::map<std::string, double> gauges_;
};

} // namespace texharvest

#endif // TEXHARVEST_METRICS_HPP
