#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/HistoryStore.hpp"
#include "core/HistorySynthesizer.hpp"
#include "core/MersenneRandomSource.hpp"
#include "support/Fakes.hpp"

using testing_support::FakeClock;
using testing_support::FixedFractionRandom;
using testing_support::makeQuote;
using testing_support::nearlyEqual;

namespace {

constexpr double kTolerance = 1e-12;

// Checks every structural invariant of a synthesized series.
bool checkSeries(const domain::HistorySeries& series,
                 const domain::Quote& quote,
                 domain::Timeframe timeframe,
                 domain::TimestampMs now,
                 std::string& why) {
    const auto& config = domain::timeframeConfig(timeframe);
    const auto label = domain::timeframeToString(timeframe);

    if (series.size() != config.pointCount) {
        why = label + ": wrong point count " + std::to_string(series.size());
        return false;
    }
    if (!series.synthetic || series.generatedAt != now || series.symbol != quote.symbol ||
        series.timeframe != timeframe || series.source != quote.source) {
        why = label + ": wrong series metadata";
        return false;
    }
    if (series.points.back().price != quote.price) {
        why = label + ": final point differs from the quote price";
        return false;
    }
    if (series.points.back().ts != now) {
        why = label + ": series does not end at now";
        return false;
    }

    const double spread = std::fabs(series.startPrice / quote.price - 1.0);
    if (spread < config.minSpread - kTolerance || spread > config.maxSpread + kTolerance) {
        why = label + ": start price outside the spread band";
        return false;
    }
    if (config.direction == domain::SpreadDirection::Below && !(series.startPrice < quote.price)) {
        why = label + ": start price must be below the current price";
        return false;
    }

    const double share = quote.volume24h * static_cast<double>(config.intervalMs) / static_cast<double>(domain::kDayMs);
    const double supply = quote.marketCap / quote.price;
    const std::size_t last = config.pointCount - 1;

    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& point = series.points[i];
        if (i > 0 && point.ts - series.points[i - 1].ts != config.intervalMs) {
            why = label + ": timestamps do not step by the interval at " + std::to_string(i);
            return false;
        }
        if (!(point.price > 0.0)) {
            why = label + ": non-positive price at " + std::to_string(i);
            return false;
        }
        if (i < last) {
            const double progress = static_cast<double>(i) / static_cast<double>(last);
            const double base = series.startPrice + (quote.price - series.startPrice) * progress;
            if (std::fabs(point.price - base) / base > config.maxVariation + kTolerance) {
                why = label + ": volatility bound exceeded at " + std::to_string(i);
                return false;
            }
        }
        if (point.volume < share * 0.5 * (1.0 - kTolerance) || point.volume > share * 1.5 * (1.0 + kTolerance)) {
            why = label + ": volume outside the jitter band at " + std::to_string(i);
            return false;
        }
        if (!nearlyEqual(point.marketCap, point.price * supply)) {
            why = label + ": market cap not supply-consistent at " + std::to_string(i);
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    FakeClock clock;
    core::MersenneRandomSource random(42);
    core::HistorySynthesizer synthesizer(random, clock);

    // BTC over 24h.
    {
        auto btc = makeQuote("BTC", 65000.0, 1, 2.4e10, 1.27e12);
        btc.source = "coingecko";
        const auto series = synthesizer.synthesize(btc, domain::Timeframe::OneDay);
        std::string why;
        if (!checkSeries(series, btc, domain::Timeframe::OneDay, clock.nowMs(), why)) {
            std::cerr << "BTC 24h: " << why << "\n";
            return 1;
        }
        if (series.size() != 24U || series.points[1].ts - series.points[0].ts != domain::kHourMs ||
            series.points.back().price != 65000.0) {
            std::cerr << "BTC 24h series shape mismatch\n";
            return 1;
        }
    }

    // Every timeframe, many draws.
    for (int round = 0; round < 40; ++round) {
        clock.advance(1234);
        auto quote = makeQuote("ETH", 3123.45 + round, 2, 1.5e10, 3.8e11);
        quote.source = "binance";
        for (const auto timeframe : domain::kAllTimeframes) {
            const auto series = synthesizer.synthesize(quote, timeframe);
            std::string why;
            if (!checkSeries(series, quote, timeframe, clock.nowMs(), why)) {
                std::cerr << "round " << round << ": " << why << "\n";
                return 1;
            }
        }
    }

    // Draws pinned to the top of every range: start above, points at +maxVariation.
    {
        FixedFractionRandom top(1.0);
        core::HistorySynthesizer pinned(top, clock);
        const auto quote = makeQuote("SOL", 200.0, 5, 1.0e9, 9.0e10);
        const auto series = pinned.synthesize(quote, domain::Timeframe::OneWeek);
        const auto& config = domain::timeframeConfig(domain::Timeframe::OneWeek);
        if (!nearlyEqual(series.startPrice, 200.0 * (1.0 + config.maxSpread)) ||
            !nearlyEqual(series.points.front().price, series.startPrice * (1.0 + config.maxVariation)) ||
            series.points.back().price != 200.0) {
            std::cerr << "Pinned-high draws produced an unexpected series\n";
            return 1;
        }
    }

    // Draws pinned to the bottom: start below by minSpread.
    {
        FixedFractionRandom bottom(0.0);
        core::HistorySynthesizer pinned(bottom, clock);
        const auto quote = makeQuote("ADA", 0.5, 9, 0.0, 0.0);
        const auto series = pinned.synthesize(quote, domain::Timeframe::OneHour);
        const auto& config = domain::timeframeConfig(domain::Timeframe::OneHour);
        if (!nearlyEqual(series.startPrice, 0.5 * (1.0 - config.minSpread))) {
            std::cerr << "Pinned-low draws should start minSpread below\n";
            return 1;
        }
        for (const auto& point : series.points) {
            if (point.volume != 0.0 || point.marketCap != 0.0) {
                std::cerr << "Missing volume and market cap must synthesize as zero\n";
                return 1;
            }
        }
    }

    // Invalid quotes produce no series.
    for (const double price : {0.0, -10.0, std::numeric_limits<double>::quiet_NaN()}) {
        try {
            synthesizer.synthesize(makeQuote("BAD", price, 0), domain::Timeframe::OneDay);
            std::cerr << "Expected synthesis to reject price " << price << "\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }
    }

    // Store keeps whole snapshots per (symbol, timeframe).
    {
        core::HistoryStore store;
        const auto quote = makeQuote("btc", 65000.0, 1, 2.4e10, 1.27e12);
        auto first = std::make_shared<domain::HistorySeries>(synthesizer.synthesize(quote, domain::Timeframe::OneDay));
        store.update(first);
        const auto held = store.snapshot("BTC", domain::Timeframe::OneDay);
        const auto version = store.version();

        store.update(std::make_shared<domain::HistorySeries>(synthesizer.synthesize(quote, domain::Timeframe::OneDay)));
        store.update(std::make_shared<domain::HistorySeries>(synthesizer.synthesize(quote, domain::Timeframe::OneHour)));
        if (held != first || store.snapshot("btc", domain::Timeframe::OneDay) == first || store.size() != 2U ||
            store.version() != version + 2U) {
            std::cerr << "HistoryStore must swap whole snapshots\n";
            return 1;
        }
        if (!store.erase("BTC", domain::Timeframe::OneHour) || store.erase("BTC", domain::Timeframe::OneHour) ||
            store.snapshot("BTC", domain::Timeframe::OneYear)) {
            std::cerr << "HistoryStore erase/lookup misbehaved\n";
            return 1;
        }
        store.clear();
        if (store.size() != 0U || held->size() != 24U) {
            std::cerr << "clear must drop entries without invalidating held snapshots\n";
            return 1;
        }
    }

    std::cout << "history synthesizer tests passed\n";
    return 0;
}
