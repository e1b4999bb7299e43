#include "core/QuoteCache.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace core {

QuoteCache::QuoteCache(const IClock& clock, std::chrono::milliseconds ttl)
    : clock_(clock), ttl_(ttl) {}

std::string QuoteCache::key_(const std::string& symbol) {
    std::string key = symbol;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return key;
}

std::optional<domain::Quote> QuoteCache::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key_(symbol));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.quote;
}

std::optional<CacheEntry> QuoteCache::entry(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key_(symbol));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<domain::Quote> QuoteCache::getAll() const {
    std::vector<domain::Quote> quotes;
    std::lock_guard<std::mutex> lock(mutex_);
    quotes.reserve(entries_.size());
    for (const auto& [key, cached] : entries_) {
        quotes.push_back(cached.quote);
    }
    return quotes;
}

bool QuoteCache::put(domain::Quote quote) {
    if (!quote.valid()) {
        return false;
    }
    auto key = key_(quote.symbol);
    CacheEntry fresh{std::move(quote), clock_.nowMs(), ttl_};

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[std::move(key)] = std::move(fresh);
    return true;
}

bool QuoteCache::isStale(const std::string& symbol, std::chrono::milliseconds maxAge) const {
    const auto cached = entry(symbol);
    if (!cached) {
        return true;
    }
    return clock_.nowMs() - cached->fetchedAt > maxAge.count();
}

bool QuoteCache::isStale(const std::string& symbol) const {
    return isStale(symbol, ttl_);
}

std::size_t QuoteCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace core
