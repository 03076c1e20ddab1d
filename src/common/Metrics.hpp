#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vpb::common::metrics {

class Registry {
public:
    struct LatencySnapshot {
        std::uint64_t samples{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, LatencySnapshot> latencies;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    // Records the time between construction and destruction under `key`.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string key);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string key_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    std::uint64_t counter(const std::string& counterKey) const;
    void setGauge(const std::string& gaugeKey, double value);
    void observeLatency(const std::string& key, double latencyMs);
    Snapshot snapshot() const;

private:
    static constexpr std::size_t kMaxLatencySamples = 1024;

    struct LatencySeries {
        std::uint64_t total{0};
        std::deque<double> recentMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LatencySeries> latencies_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeSnapshot> gauges_;
};

}  // namespace vpb::common::metrics
