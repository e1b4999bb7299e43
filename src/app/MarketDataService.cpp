#include "app/MarketDataService.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {

using mkt::common::metrics::Registry;

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool rankedBefore(const domain::Quote& lhs, const domain::Quote& rhs) {
    const bool lhsRanked = lhs.rank > 0;
    const bool rhsRanked = rhs.rank > 0;
    if (lhsRanked != rhsRanked) {
        return lhsRanked;
    }
    if (lhsRanked && lhs.rank != rhs.rank) {
        return lhs.rank < rhs.rank;
    }
    return lhs.symbol < rhs.symbol;
}

void truncate(std::vector<domain::Quote>& quotes, std::size_t limit) {
    if (limit > 0 && quotes.size() > limit) {
        quotes.resize(limit);
    }
}

}  // namespace

MarketDataService::MarketDataService(std::vector<ProviderSlot> providers,
                                     const core::IClock& clock,
                                     core::IRandomSource& random,
                                     MarketDataOptions options)
    : options_(options),
      client_(std::move(providers), clock),
      cache_(clock, options.quoteTtl),
      synthesizer_(random, clock),
      scheduler_([this]() { refresh(); }) {}

MarketDataService::~MarketDataService() {
    scheduler_.stop();
}

std::optional<domain::Quote> MarketDataService::getQuote(const std::string& symbol) const {
    return cache_.get(symbol);
}

std::vector<domain::Quote> MarketDataService::listQuotes(std::size_t limit) const {
    auto quotes = cache_.getAll();
    std::sort(quotes.begin(), quotes.end(), rankedBefore);
    truncate(quotes, limit);
    return quotes;
}

MarketDataService::SeriesPtr MarketDataService::getHistory(const std::string& symbol,
                                                           domain::Timeframe timeframe) const {
    return histories_.snapshot(symbol, timeframe);
}

MarketDataService::SeriesPtr MarketDataService::getHistory(const std::string& symbol,
                                                           const std::string& timeframe) const {
    const auto parsed = domain::timeframeFromString(timeframe);
    if (!parsed) {
        return nullptr;
    }
    return getHistory(symbol, *parsed);
}

bool MarketDataService::isStale(const std::string& symbol) const {
    return cache_.isStale(symbol);
}

void MarketDataService::refresh(std::optional<std::vector<domain::Symbol>> symbols) {
    domain::QuoteRequest request;
    if (symbols) {
        for (auto& symbol : *symbols) {
            request.symbols.push_back(toUpper(std::move(symbol)));
        }
    } else {
        request.topN = options_.topN;
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        for (const auto& [symbol, timeframe] : subscriptions_) {
            if (std::find(request.symbols.begin(), request.symbols.end(), symbol) == request.symbols.end()) {
                request.symbols.push_back(symbol);
            }
        }
    }

    const auto result = client_.fetch_quotes(request);
    Registry::instance().incrementCounter("refresh.rounds");

    // A cooldown replay is not a new fetch; the cache already holds it or newer.
    const auto updated = result.replayed() ? std::vector<domain::Symbol>{} : apply_quotes_(result);
    const std::unordered_set<std::string> updatedSet(updated.begin(), updated.end());

    std::vector<MarketEvent> events;
    if (!updated.empty()) {
        events.emplace_back(QuotesUpdated{result.source, updated});
    }
    std::size_t regenerated = 0;

    for (const auto& [symbol, timeframe] : subscriptions()) {
        const bool quoteChanged = updatedSet.count(symbol) > 0;
        const bool missing = histories_.snapshot(symbol, timeframe) == nullptr;
        if (!quoteChanged && !missing) {
            continue;
        }
        if (resynthesize_(symbol, timeframe)) {
            events.emplace_back(HistoryUpdated{symbol, timeframe});
            ++regenerated;
        }
    }

    LOG_INFO("Refresh round source=" << result.source << " quotes=" << result.quotes.size()
                                     << " cached=" << updated.size() << " histories=" << regenerated);
    publish_(events);
}

// Writes a round's quotes into the cache and returns the symbols written.
// Reference data only fills symbols the cache has never seen.
std::vector<domain::Symbol> MarketDataService::apply_quotes_(const FetchResult& result) {
    std::vector<domain::Symbol> updated;
    updated.reserve(result.quotes.size());
    const bool reference = result.usedReference();

    for (const auto& quote : result.quotes) {
        if (reference && cache_.get(quote.symbol)) {
            continue;
        }
        if (cache_.put(quote)) {
            updated.push_back(toUpper(quote.symbol));
        } else {
            LOG_WARN("Rejected invalid quote for '" << quote.symbol << "' from " << result.source);
        }
    }

    Registry::instance().setGauge("cache.size", static_cast<double>(cache_.size()));
    return updated;
}

// Reads the quote back from the cache so the series matches what readers see.
// The series is stored only while the pair is still subscribed.
bool MarketDataService::resynthesize_(const domain::Symbol& symbol, domain::Timeframe timeframe) {
    const auto quote = cache_.get(symbol);
    if (!quote) {
        return false;
    }

    auto& registry = Registry::instance();
    try {
        auto series = std::make_shared<domain::HistorySeries>(synthesizer_.synthesize(*quote, timeframe));
        series->symbol = toUpper(series->symbol);
        {
            std::lock_guard<std::mutex> lock(subscriptionsMutex_);
            if (subscriptions_.count({symbol, timeframe}) == 0) {
                return false;
            }
            histories_.update(std::move(series));
        }
        registry.incrementCounter("history.synthesized");
        return true;
    } catch (const std::invalid_argument& ex) {
        registry.incrementCounter("history.rejected");
        LOG_WARN("History for " << symbol << " " << domain::timeframeToString(timeframe)
                                << " not regenerated: " << ex.what());
    }
    return false;
}

void MarketDataService::subscribeHistory(const std::string& symbol, domain::Timeframe timeframe) {
    const auto key = toUpper(symbol);
    if (key.empty()) {
        throw std::invalid_argument("subscribeHistory: empty symbol");
    }
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        subscriptions_.emplace(key, timeframe);
    }
    update_subscription_gauge_();

    if (histories_.snapshot(key, timeframe)) {
        return;
    }
    if (resynthesize_(key, timeframe)) {
        publish_({HistoryUpdated{key, timeframe}});
    }
}

void MarketDataService::unsubscribeHistory(const std::string& symbol, domain::Timeframe timeframe) {
    const auto key = toUpper(symbol);
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        subscriptions_.erase({key, timeframe});
        histories_.erase(key, timeframe);
    }
    update_subscription_gauge_();
}

std::vector<MarketDataService::Subscription> MarketDataService::subscriptions() const {
    std::lock_guard<std::mutex> lock(subscriptionsMutex_);
    return {subscriptions_.begin(), subscriptions_.end()};
}

void MarketDataService::update_subscription_gauge_() const {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        count = subscriptions_.size();
    }
    Registry::instance().setGauge("subscriptions.active", static_cast<double>(count));
}

std::optional<domain::GlobalMetrics> MarketDataService::globalMetrics() const {
    const auto quotes = cache_.getAll();
    if (quotes.empty()) {
        return std::nullopt;
    }

    domain::GlobalMetrics metrics;
    double btcCap = 0.0;
    double ethCap = 0.0;
    for (const auto& quote : quotes) {
        metrics.totalMarketCap += quote.marketCap;
        metrics.totalVolume24h += quote.volume24h;
        metrics.lastUpdated = std::max(metrics.lastUpdated, quote.lastUpdated);
        if (quote.symbol == "BTC") {
            btcCap = quote.marketCap;
        } else if (quote.symbol == "ETH") {
            ethCap = quote.marketCap;
        }
    }
    metrics.assetCount = quotes.size();
    if (metrics.totalMarketCap > 0.0) {
        metrics.btcDominance = btcCap / metrics.totalMarketCap * 100.0;
        metrics.ethDominance = ethCap / metrics.totalMarketCap * 100.0;
    }
    return metrics;
}

std::vector<domain::Quote> MarketDataService::searchQuotes(const std::string& query, std::size_t limit) const {
    const auto needle = toLower(query);
    if (needle.empty()) {
        return listQuotes(limit);
    }

    std::vector<domain::Quote> exact;
    std::vector<domain::Quote> partial;
    for (auto& quote : listQuotes()) {
        const auto symbol = toLower(quote.symbol);
        if (symbol == needle) {
            exact.push_back(std::move(quote));
        } else if (symbol.find(needle) != std::string::npos || toLower(quote.name).find(needle) != std::string::npos) {
            partial.push_back(std::move(quote));
        }
    }

    exact.insert(exact.end(), std::make_move_iterator(partial.begin()), std::make_move_iterator(partial.end()));
    truncate(exact, limit);
    return exact;
}

void MarketDataService::clearHistories() {
    histories_.clear();
    LOG_INFO("Cleared stored histories");
}

ListenerId MarketDataService::addListener(MarketListener listener) {
    if (!listener) {
        throw std::invalid_argument("addListener: empty listener");
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    const auto id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool MarketDataService::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_.erase(id) > 0;
}

void MarketDataService::publish_(const std::vector<MarketEvent>& events) {
    if (events.empty()) {
        return;
    }
    std::vector<MarketListener> targets;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        targets.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            targets.push_back(listener);
        }
    }

    for (const auto& event : events) {
        for (const auto& listener : targets) {
            try {
                listener(event);
            } catch (const std::exception& ex) {
                LOG_WARN("Market listener threw: " << ex.what());
            }
        }
    }
}

void MarketDataService::startAutoRefresh(std::chrono::milliseconds interval) {
    scheduler_.start(interval);
}

void MarketDataService::stopAutoRefresh() {
    scheduler_.stop();
}

void MarketDataService::forceRefreshNow() {
    scheduler_.forceRefreshNow();
}

bool MarketDataService::isAutoRefreshing() const {
    return scheduler_.isRunning();
}

}  // namespace app
