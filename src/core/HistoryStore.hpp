#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "domain/MarketTypes.hpp"
#include "domain/Timeframe.hpp"

namespace core {

// Immutable series snapshots keyed by (symbol, timeframe). Writers swap in a
// whole new series; readers keep whatever snapshot they already hold.
class HistoryStore {
public:
    using SeriesPtr = std::shared_ptr<const domain::HistorySeries>;

    void update(SeriesPtr series);
    SeriesPtr snapshot(const std::string& symbol, domain::Timeframe timeframe) const;
    bool erase(const std::string& symbol, domain::Timeframe timeframe);
    void clear();

    std::size_t size() const;
    std::uint64_t version() const;

private:
    using Key = std::pair<std::string, domain::Timeframe>;

    static Key key_(const std::string& symbol, domain::Timeframe timeframe);

    mutable std::mutex mutex_;
    std::map<Key, SeriesPtr> series_;
    std::atomic<std::uint64_t> ver_{0};
};

}  // namespace core
