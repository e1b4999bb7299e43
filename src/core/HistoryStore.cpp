#include "core/HistoryStore.hpp"

#include <algorithm>
#include <cctype>

namespace core {

HistoryStore::Key HistoryStore::key_(const std::string& symbol, domain::Timeframe timeframe) {
    std::string upper = symbol;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return {std::move(upper), timeframe};
}

void HistoryStore::update(SeriesPtr series) {
    if (!series || series->empty()) {
        return;
    }
    auto key = key_(series->symbol, series->timeframe);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        series_[std::move(key)] = std::move(series);
    }
    ver_.fetch_add(1, std::memory_order_relaxed);
}

HistoryStore::SeriesPtr HistoryStore::snapshot(const std::string& symbol, domain::Timeframe timeframe) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = series_.find(key_(symbol, timeframe));
    return it == series_.end() ? nullptr : it->second;
}

bool HistoryStore::erase(const std::string& symbol, domain::Timeframe timeframe) {
    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = series_.erase(key_(symbol, timeframe)) > 0;
    }
    if (erased) {
        ver_.fetch_add(1, std::memory_order_relaxed);
    }
    return erased;
}

void HistoryStore::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        series_.clear();
    }
    ver_.fetch_add(1, std::memory_order_relaxed);
}

std::size_t HistoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series_.size();
}

std::uint64_t HistoryStore::version() const {
    return ver_.load(std::memory_order_relaxed);
}

}  // namespace core
