#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mkt::common::metrics {

class Registry {
private:
    class ScopedTimerImpl;

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

    // Records the lifetime of the scope as one latency sample under `key`.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string key);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    std::uint64_t counterValue(const std::string& counterKey) const;
    void setGauge(const std::string& gaugeKey, double value);
    Snapshot snapshot() const;

private:
    // Bounded so a long-running process keeps a sliding window of samples.
    static constexpr std::size_t kMaxSamplesPerKey = 1024;

    struct LatencyMetrics {
        std::atomic<std::uint64_t> samples{0};
        mutable std::mutex samplesMutex;
        std::vector<double> windowMs;
        std::size_t nextSlot{0};

        void add(double latencyMs);
        std::vector<double> copyWindow() const;
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, std::string key);
        ~ScopedTimerImpl();

    private:
        LatencyMetrics* metrics_{nullptr};
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    LatencyMetrics& ensureLatencyMetrics(const std::string& key);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<LatencyMetrics>> latencyMetrics_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace mkt::common::metrics
