#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "app/RefreshScheduler.hpp"
#include "app/SourceFallbackClient.hpp"
#include "core/HistoryStore.hpp"
#include "core/HistorySynthesizer.hpp"
#include "core/QuoteCache.hpp"
#include "core/ports/IClock.hpp"
#include "core/ports/IRandomSource.hpp"
#include "domain/MarketTypes.hpp"
#include "domain/Timeframe.hpp"

namespace app {

struct QuotesUpdated {
    std::string source;
    std::vector<domain::Symbol> symbols;
};

struct HistoryUpdated {
    domain::Symbol symbol;
    domain::Timeframe timeframe{domain::Timeframe::OneDay};
};

using MarketEvent = std::variant<QuotesUpdated, HistoryUpdated>;
using MarketListener = std::function<void(const MarketEvent&)>;
using ListenerId = std::uint64_t;

struct MarketDataOptions {
    std::size_t topN{50};
    std::chrono::milliseconds quoteTtl{300000};
};

// Entry point for everything outside the market data core. Quotes are read
// from the cache and histories from the store; neither read touches the
// network. Histories exist only for subscribed (symbol, timeframe) pairs.
class MarketDataService {
public:
    using SeriesPtr = core::HistoryStore::SeriesPtr;
    using Subscription = std::pair<domain::Symbol, domain::Timeframe>;

    MarketDataService(std::vector<ProviderSlot> providers,
                      const core::IClock& clock,
                      core::IRandomSource& random,
                      MarketDataOptions options = {});
    ~MarketDataService();

    MarketDataService(const MarketDataService&) = delete;
    MarketDataService& operator=(const MarketDataService&) = delete;

    std::optional<domain::Quote> getQuote(const std::string& symbol) const;
    // By rank ascending, unranked last. limit == 0 returns everything.
    std::vector<domain::Quote> listQuotes(std::size_t limit = 0) const;
    SeriesPtr getHistory(const std::string& symbol, domain::Timeframe timeframe) const;
    SeriesPtr getHistory(const std::string& symbol, const std::string& timeframe) const;
    bool isStale(const std::string& symbol) const;

    // Without symbols: the configured top-N plus every subscribed symbol.
    // Provider failures never escape; the cache keeps its last values.
    void refresh(std::optional<std::vector<domain::Symbol>> symbols = std::nullopt);

    void subscribeHistory(const std::string& symbol, domain::Timeframe timeframe);
    void unsubscribeHistory(const std::string& symbol, domain::Timeframe timeframe);
    std::vector<Subscription> subscriptions() const;

    std::optional<domain::GlobalMetrics> globalMetrics() const;
    std::vector<domain::Quote> searchQuotes(const std::string& query, std::size_t limit = 0) const;
    void clearHistories();

    ListenerId addListener(MarketListener listener);
    bool removeListener(ListenerId id);

    void startAutoRefresh(std::chrono::milliseconds interval);
    void stopAutoRefresh();
    void forceRefreshNow();
    bool isAutoRefreshing() const;

    const SourceFallbackClient& sources() const noexcept { return client_; }

private:
    std::vector<domain::Symbol> apply_quotes_(const FetchResult& result);
    bool resynthesize_(const domain::Symbol& symbol, domain::Timeframe timeframe);
    void publish_(const std::vector<MarketEvent>& events);
    void update_subscription_gauge_() const;

    MarketDataOptions options_;
    SourceFallbackClient client_;
    core::QuoteCache cache_;
    core::HistorySynthesizer synthesizer_;
    core::HistoryStore histories_;

    // Also held while a subscribed series is stored or dropped.
    mutable std::mutex subscriptionsMutex_;
    std::set<Subscription> subscriptions_;

    std::mutex listenersMutex_;
    std::map<ListenerId, MarketListener> listeners_;
    ListenerId nextListenerId_{1};

    // Last member: its worker must stop before anything above goes away.
    RefreshScheduler scheduler_;
};

}  // namespace app
