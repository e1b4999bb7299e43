#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "app/MarketDataService.hpp"
#include "common/Log.hpp"
#include "core/MersenneRandomSource.hpp"
#include "support/Fakes.hpp"

using testing_support::FakeClock;
using testing_support::FakeQuoteSource;
using testing_support::makeQuote;

namespace {

using namespace std::chrono_literals;

std::vector<domain::Quote> marketQuotes(double btcPrice) {
    return {makeQuote("BTC", btcPrice, 1, 2.4e10, 1.2e12), makeQuote("ETH", 3000.0, 2, 1.5e10, 4.0e11),
            makeQuote("SOL", 150.0, 5, 3.0e9, 7.0e10), makeQuote("WBTC", 64900.0, 15, 3.0e8, 1.0e10)};
}

struct Fixture {
    explicit Fixture(std::size_t topN = 50) {
        alpha = std::make_shared<FakeQuoteSource>("alpha", marketQuotes(65000.0));
        app::MarketDataOptions options;
        options.topN = topN;
        options.quoteTtl = 5min;
        service = std::make_unique<app::MarketDataService>(std::vector<app::ProviderSlot>{{alpha, 0ms}}, clock,
                                                           random, options);
    }

    FakeClock clock;
    core::MersenneRandomSource random{7};
    std::shared_ptr<FakeQuoteSource> alpha;
    std::unique_ptr<app::MarketDataService> service;
};

// Runs a one-shot hook from inside the next draw, i.e. mid-synthesis.
class HookedRandom final : public core::IRandomSource {
public:
    void arm(std::function<void()> hook) { hook_ = std::move(hook); }

    double uniform(double lo, double hi) override {
        if (hook_) {
            auto hook = std::move(hook_);
            hook_ = nullptr;
            hook();
        }
        return lo + 0.5 * (hi - lo);
    }

private:
    std::function<void()> hook_;
};

bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

int checkAllProvidersDown() {
    Fixture fx;
    fx.alpha->setFailing(true);

    if (fx.service->getQuote("BTC") || fx.service->globalMetrics()) {
        std::cerr << "Nothing may be returned before the first refresh\n";
        return 1;
    }

    fx.service->refresh();
    const auto quotes = fx.service->listQuotes();
    if (quotes.size() != 10U) {
        std::cerr << "Expected the reference dataset, got " << quotes.size() << " quotes\n";
        return 1;
    }
    for (std::size_t i = 0; i < quotes.size(); ++i) {
        if (quotes[i].source != "reference-fallback" || quotes[i].rank != static_cast<std::int32_t>(i + 1)) {
            std::cerr << "Reference quotes must be tagged and listed by rank\n";
            return 1;
        }
    }
    return 0;
}

int checkSubscriptionPolicy() {
    Fixture fx;
    fx.alpha->setFailing(true);
    fx.service->refresh();

    if (fx.service->getHistory("DOGE", "1y")) {
        std::cerr << "History must be absent before subscribing\n";
        return 1;
    }
    if (fx.service->getHistory("DOGE", "2y")) {
        std::cerr << "Unknown timeframe must read as absent\n";
        return 1;
    }

    fx.service->subscribeHistory("doge", domain::Timeframe::OneYear);
    fx.service->subscribeHistory("DOGE", domain::Timeframe::OneYear);
    const auto series = fx.service->getHistory("DOGE", "1y");
    const auto doge = fx.service->getQuote("DOGE");
    if (!series || !doge || series->size() != 365U || series->points.back().price != doge->price ||
        !series->synthetic || series->source != "reference-fallback") {
        std::cerr << "Subscribing must synthesize from the cached quote\n";
        return 1;
    }
    if (fx.service->subscriptions().size() != 1U) {
        std::cerr << "Subscriptions must be idempotent\n";
        return 1;
    }

    fx.service->unsubscribeHistory("DOGE", domain::Timeframe::OneYear);
    if (fx.service->getHistory("DOGE", domain::Timeframe::OneYear) || !fx.service->subscriptions().empty()) {
        std::cerr << "Unsubscribing must drop the series\n";
        return 1;
    }

    // Subscribing before any quote exists defers synthesis to the next refresh.
    fx.service->subscribeHistory("PEPE", domain::Timeframe::OneDay);
    if (fx.service->getHistory("PEPE", domain::Timeframe::OneDay)) {
        std::cerr << "No series may exist without a quote\n";
        return 1;
    }
    return 0;
}

int checkStaleButAvailable() {
    Fixture fx;
    fx.service->refresh();
    const auto first = fx.service->getQuote("BTC");
    if (!first || first->source != "alpha" || first->price != 65000.0) {
        std::cerr << "First refresh must cache alpha quotes\n";
        return 1;
    }

    fx.alpha->setFailing(true);
    fx.clock.advance(10LL * 60 * 1000);
    fx.service->refresh();

    const auto kept = fx.service->getQuote("BTC");
    if (!kept || kept->source != "alpha" || kept->price != 65000.0) {
        std::cerr << "Failed refresh must not replace real data with reference data\n";
        return 1;
    }
    if (!fx.service->isStale("BTC")) {
        std::cerr << "Quote older than the TTL must report stale\n";
        return 1;
    }
    const auto filled = fx.service->getQuote("DOGE");
    if (!filled || filled->source != "reference-fallback") {
        std::cerr << "Reference data should fill symbols never fetched\n";
        return 1;
    }
    return 0;
}

int checkCooldownReplayKeepsNewerQuote() {
    FakeClock clock;
    core::MersenneRandomSource random{11};
    auto alpha = std::make_shared<FakeQuoteSource>("alpha", marketQuotes(65000.0));
    auto beta = std::make_shared<FakeQuoteSource>("beta", marketQuotes(70000.0));
    app::MarketDataOptions options;
    options.quoteTtl = 2s;
    app::MarketDataService service({{alpha, 3s}, {beta, 3s}}, clock, random, options);

    service.refresh();
    clock.advance(5000);
    alpha->setFailing(true);
    service.refresh();
    const auto fromBeta = service.getQuote("BTC");
    if (!fromBeta || fromBeta->price != 70000.0 || fromBeta->source != "beta") {
        std::cerr << "Failed alpha round must cache beta's answer\n";
        return 1;
    }

    std::atomic<int> quoteEvents{0};
    service.addListener([&](const app::MarketEvent& event) {
        if (std::holds_alternative<app::QuotesUpdated>(event)) {
            quoteEvents.fetch_add(1);
        }
    });

    // Both providers are inside their cooldown here.
    clock.advance(1000);
    service.refresh();
    const auto afterCooldown = service.getQuote("BTC");
    if (!afterCooldown || afterCooldown->price != 70000.0 || afterCooldown->source != "beta" || beta->calls() != 1) {
        std::cerr << "Cooldown round must not bring back alpha's older price\n";
        return 1;
    }

    clock.advance(1500);
    service.refresh();
    if (!service.isStale("BTC") || quoteEvents.load() != 0) {
        std::cerr << "Replayed answers must not refresh the cache entry\n";
        return 1;
    }
    return 0;
}

int checkUnsubscribeDuringSynthesis() {
    FakeClock clock;
    HookedRandom random;
    auto alpha = std::make_shared<FakeQuoteSource>("alpha", marketQuotes(65000.0));
    app::MarketDataService service({{alpha, 0ms}}, clock, random, app::MarketDataOptions{});

    std::atomic<int> historyEvents{0};
    service.addListener([&](const app::MarketEvent& event) {
        if (std::holds_alternative<app::HistoryUpdated>(event)) {
            historyEvents.fetch_add(1);
        }
    });

    service.subscribeHistory("BTC", domain::Timeframe::OneDay);
    random.arm([&]() { service.unsubscribeHistory("BTC", domain::Timeframe::OneDay); });
    service.refresh();

    if (!service.getQuote("BTC")) {
        std::cerr << "Refresh must still cache the quote\n";
        return 1;
    }
    if (service.getHistory("BTC", domain::Timeframe::OneDay) || !service.subscriptions().empty() ||
        historyEvents.load() != 0) {
        std::cerr << "Series finished after its unsubscribe must be discarded\n";
        return 1;
    }

    service.refresh();
    if (service.getHistory("BTC", domain::Timeframe::OneDay)) {
        std::cerr << "Unsubscribed pair must stay absent on later rounds\n";
        return 1;
    }
    return 0;
}

int checkRefreshPipeline() {
    Fixture fx(1);

    std::mutex eventsMutex;
    std::vector<app::MarketEvent> events;
    const auto listenerId = fx.service->addListener([&](const app::MarketEvent& event) {
        std::lock_guard<std::mutex> lock(eventsMutex);
        events.push_back(event);
    });

    fx.service->subscribeHistory("ETH", domain::Timeframe::OneDay);
    fx.service->refresh();

    const auto request = fx.alpha->lastRequest();
    if (request.topN != 1U || std::find(request.symbols.begin(), request.symbols.end(), "ETH") == request.symbols.end()) {
        std::cerr << "Refresh must ask for top-N plus subscribed symbols\n";
        return 1;
    }
    if (!fx.service->getQuote("BTC") || !fx.service->getQuote("ETH") || fx.service->getQuote("SOL")) {
        std::cerr << "Only the top-N and subscribed symbols should be cached\n";
        return 1;
    }
    const auto ethSeries = fx.service->getHistory("ETH", domain::Timeframe::OneDay);
    if (!ethSeries || ethSeries->points.back().price != 3000.0) {
        std::cerr << "Subscribed series must be generated during refresh\n";
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(eventsMutex);
        const auto* quotes = events.empty() ? nullptr : std::get_if<app::QuotesUpdated>(&events.front());
        const bool historyEvent = std::any_of(events.begin(), events.end(), [](const app::MarketEvent& e) {
            const auto* h = std::get_if<app::HistoryUpdated>(&e);
            return h != nullptr && h->symbol == "ETH" && h->timeframe == domain::Timeframe::OneDay;
        });
        if (quotes == nullptr || quotes->source != "alpha" || quotes->symbols.size() != 2U || !historyEvent) {
            std::cerr << "Expected QuotesUpdated then HistoryUpdated notifications\n";
            return 1;
        }
        events.clear();
    }

    // New price flows through the cache into the regenerated series.
    auto updated = marketQuotes(65000.0);
    updated[1].price = 3300.0;
    fx.alpha->setQuotes(updated);
    fx.service->refresh(std::vector<domain::Symbol>{"eth"});
    const auto explicitRequest = fx.alpha->lastRequest();
    if (explicitRequest.topN != 0U || explicitRequest.symbols != std::vector<domain::Symbol>{"ETH"}) {
        std::cerr << "Explicit refresh must request only the listed symbols\n";
        return 1;
    }
    const auto regenerated = fx.service->getHistory("ETH", domain::Timeframe::OneDay);
    if (!regenerated || regenerated == ethSeries || regenerated->points.back().price != 3300.0) {
        std::cerr << "Series must be regenerated from the new quote\n";
        return 1;
    }

    fx.service->clearHistories();
    if (fx.service->getHistory("ETH", domain::Timeframe::OneDay) || fx.service->subscriptions().size() != 1U) {
        std::cerr << "clearHistories must drop series and keep subscriptions\n";
        return 1;
    }
    fx.service->refresh();
    if (!fx.service->getHistory("ETH", domain::Timeframe::OneDay)) {
        std::cerr << "Next refresh must regenerate cleared series\n";
        return 1;
    }

    if (!fx.service->removeListener(listenerId) || fx.service->removeListener(listenerId)) {
        std::cerr << "removeListener must succeed exactly once\n";
        return 1;
    }
    {
        std::lock_guard<std::mutex> lock(eventsMutex);
        events.clear();
    }
    fx.service->refresh();
    std::lock_guard<std::mutex> lock(eventsMutex);
    if (!events.empty()) {
        std::cerr << "Removed listener still notified\n";
        return 1;
    }
    return 0;
}

int checkQueries() {
    Fixture fx;
    if (fx.service->globalMetrics()) {
        std::cerr << "Global metrics must be absent for an empty cache\n";
        return 1;
    }
    fx.service->refresh();

    const auto top2 = fx.service->listQuotes(2);
    if (top2.size() != 2U || top2[0].symbol != "BTC" || top2[1].symbol != "ETH") {
        std::cerr << "listQuotes must order by rank and honour the limit\n";
        return 1;
    }

    const auto btc = fx.service->searchQuotes("btc");
    if (btc.size() != 2U || btc[0].symbol != "BTC" || btc[1].symbol != "WBTC") {
        std::cerr << "Exact symbol match must come first\n";
        return 1;
    }
    const auto wbtc = fx.service->searchQuotes("WBTC");
    if (wbtc.empty() || wbtc[0].symbol != "WBTC") {
        std::cerr << "Exact match must outrank better ranked partial matches\n";
        return 1;
    }
    if (fx.service->searchQuotes("so", 1).size() != 1U || !fx.service->searchQuotes("zzz").empty()) {
        std::cerr << "Search limit or miss handled incorrectly\n";
        return 1;
    }

    const auto metrics = fx.service->globalMetrics();
    const double total = 1.2e12 + 4.0e11 + 7.0e10 + 1.0e10;
    if (!metrics || metrics->assetCount != 4U || !testing_support::nearlyEqual(metrics->totalMarketCap, total) ||
        !testing_support::nearlyEqual(metrics->btcDominance, 1.2e12 / total * 100.0) ||
        !testing_support::nearlyEqual(metrics->ethDominance, 4.0e11 / total * 100.0) ||
        !testing_support::nearlyEqual(metrics->totalVolume24h, 2.4e10 + 1.5e10 + 3.0e9 + 3.0e8)) {
        std::cerr << "Global metrics aggregated incorrectly\n";
        return 1;
    }
    return 0;
}

int checkAutoRefresh() {
    Fixture fx;
    fx.service->startAutoRefresh(25ms);
    fx.service->startAutoRefresh(25ms);
    if (!waitForCondition([&]() { return fx.alpha->calls() >= 2; }, 2000ms) || !fx.service->isAutoRefreshing()) {
        std::cerr << "Auto refresh did not tick\n";
        return 1;
    }
    fx.service->stopAutoRefresh();
    const auto calls = fx.alpha->calls();
    std::this_thread::sleep_for(100ms);
    if (fx.service->isAutoRefreshing() || fx.alpha->calls() != calls) {
        std::cerr << "stopAutoRefresh must end the timer\n";
        return 1;
    }
    fx.service->forceRefreshNow();
    if (fx.alpha->calls() != calls + 1) {
        std::cerr << "forceRefreshNow must run one round immediately\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main() {
    mkt::log::setLevel(mkt::log::Level::Error);
    if (checkAllProvidersDown() != 0 || checkSubscriptionPolicy() != 0 || checkStaleButAvailable() != 0 ||
        checkCooldownReplayKeepsNewerQuote() != 0 || checkUnsubscribeDuringSynthesis() != 0 ||
        checkRefreshPipeline() != 0 || checkQueries() != 0 || checkAutoRefresh() != 0) {
        return 1;
    }
    std::cout << "market data service tests passed\n";
    return 0;
}
