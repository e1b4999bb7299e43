#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace mkt::common::metrics {
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
    return sortedValues[lowerIndex] + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string key)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), std::move(key))) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counterValue(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.latencies.reserve(latencyMetrics_.size());
    for (const auto& [key, metricsPtr] : latencyMetrics_) {
        LatencySnapshot latency;
        latency.samples = metricsPtr->samples.load(std::memory_order_relaxed);

        auto window = metricsPtr->copyWindow();
        if (!window.empty()) {
            std::sort(window.begin(), window.end());
            latency.p95Ms = computeQuantile(window, 0.95);
            latency.p99Ms = computeQuantile(window, 0.99);
        }

        snapshot.latencies.emplace(key, std::move(latency));
    }

    snapshot.counters = counters_;

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt});
    }

    return snapshot;
}

void Registry::LatencyMetrics::add(double latencyMs) {
    samples.fetch_add(1U, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(samplesMutex);
    if (windowMs.size() < kMaxSamplesPerKey) {
        windowMs.push_back(latencyMs);
        return;
    }
    windowMs[nextSlot] = latencyMs;
    nextSlot = (nextSlot + 1U) % kMaxSamplesPerKey;
}

std::vector<double> Registry::LatencyMetrics::copyWindow() const {
    std::lock_guard<std::mutex> lock(samplesMutex);
    return windowMs;
}

Registry::LatencyMetrics& Registry::ensureLatencyMetrics(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = latencyMetrics_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_unique<LatencyMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, std::string key)
    : metrics_(&registry.ensureLatencyMetrics(key)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    if (metrics_ == nullptr) {
        return;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    metrics_->add(duration.count());
}

}  // namespace mkt::common::metrics
