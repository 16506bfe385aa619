#include "../../include/metrics.hpp"
#include <algorithm>

namespace texharvest {

namespace {

std::string counter_key(const std::string_view name, const MetricTags& tags) {
    std::string key(name);
    if (tags.empty()) return key;
    key += '{';
    bool first = true;
    for (const auto& [k, v] : tags) {
        if (!first) key += ',';
        key += k;
        key += '=';
        key += v;
        first = false;
    }
    key += '}';
    return key;
}

} // namespace

void MetricsCollector::increment(const std::string_view name, const MetricTags& tags, const std::int64_t value) {
    std::lock_guard lock(mtx_);
    counters_[std::string(name)] += value;
    if (!tags.empty()) {
        counters_[counter_key(name, tags)] += value;
    }
}

void MetricsCollector::observe(const std::string_view name, const std::chrono::milliseconds duration) {
    const auto ms = static_cast<double>(duration.count());
    std::lock_guard lock(mtx_);
    auto& t = timers_[std::string(name)];
    if (t.count == 0) {
        t.min_ms = ms;
        t.max_ms = ms;
    } else {
        t.min_ms = std::min(t.min_ms, ms);
        t.max_ms = std::max(t.max_ms, ms);
    }
    ++t.count;
    t.sum_ms += ms;
}

void MetricsCollector::gauge(const std::string_view name, const double value) {
    std::lock_guard lock(mtx_);
    gauges_[std::string(name)] = value;
}

MetricsSnapshot MetricsCollector::snapshot() const {
    std::lock_guard lock(mtx_);
    MetricsSnapshot snap;
    snap.counters = counters_;
    snap.gauges = gauges_;
    for (const auto& [name, t] : timers_) {
        TimerStats stats;
        stats.count = t.count;
        stats.avg_ms = t.count ? t.sum_ms / static_cast<double>(t.count) : 0.0;
        stats.min_ms = t.min_ms;
        stats.max_ms = t.max_ms;
        snap.timers.emplace(name, stats);
    }
    return snap;
}

std::int64_t MetricsCollector::counter(const std::string& key) const {
    std::lock_guard lock(mtx_);
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
}

} // namespace texharvest
