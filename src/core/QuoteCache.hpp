#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ports/IClock.hpp"
#include "domain/MarketTypes.hpp"

namespace core {

struct CacheEntry {
    domain::Quote quote;
    domain::TimestampMs fetchedAt{0};
    std::chrono::milliseconds ttl{0};
};

// Latest known quote per symbol. Entries are replaced by newer writes and are
// never evicted for age; staleness is reported, not enforced. Symbol lookups
// are case-insensitive.
class QuoteCache {
public:
    QuoteCache(const IClock& clock, std::chrono::milliseconds ttl);

    std::optional<domain::Quote> get(const std::string& symbol) const;
    std::optional<CacheEntry> entry(const std::string& symbol) const;
    std::vector<domain::Quote> getAll() const;

    // Stamps the entry with the clock's now. Invalid quotes are rejected and
    // leave any previous entry in place.
    bool put(domain::Quote quote);

    // True when the symbol is absent or older than maxAge.
    bool isStale(const std::string& symbol, std::chrono::milliseconds maxAge) const;
    bool isStale(const std::string& symbol) const;

    std::size_t size() const;

private:
    static std::string key_(const std::string& symbol);

    const IClock& clock_;
    const std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
};

}  // namespace core
