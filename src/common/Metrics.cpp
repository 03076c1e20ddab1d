#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace vpb::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string key)
    : key_(std::move(key)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    Registry::instance().observeLatency(key_, elapsed.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = std::chrono::steady_clock::now();
}

void Registry::observeLatency(const std::string& key, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = latencies_[key];
    ++series.total;
    series.recentMs.push_back(latencyMs);
    if (series.recentMs.size() > kMaxLatencySamples) {
        series.recentMs.pop_front();
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.latencies.reserve(latencies_.size());
    for (const auto& [key, series] : latencies_) {
        LatencySnapshot latency;
        latency.samples = series.total;
        if (!series.recentMs.empty()) {
            std::vector<double> sorted(series.recentMs.begin(), series.recentMs.end());
            std::sort(sorted.begin(), sorted.end());
            latency.p95Ms = computeQuantile(sorted, 0.95);
            latency.p99Ms = computeQuantile(sorted, 0.99);
        }
        snapshot.latencies.emplace(key, latency);
    }

    snapshot.counters = counters_;
    snapshot.gauges = gauges_;
    return snapshot;
}

}  // namespace vpb::common::metrics
