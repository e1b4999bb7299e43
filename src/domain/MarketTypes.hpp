#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "domain/Timeframe.hpp"

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

// Provenance tag stamped on quotes built from the compiled-in table.
inline constexpr const char* kReferenceFallbackSource = "reference-fallback";

struct Quote {
    Symbol symbol;
    std::string name;
    double price{0.0};
    double change24h{0.0};
    double changePercent24h{0.0};
    double volume24h{0.0};
    double marketCap{0.0};
    std::int32_t rank{0};
    TimestampMs lastUpdated{0};
    std::string source;

    bool valid() const noexcept { return std::isfinite(price) && price > 0.0 && !symbol.empty(); }
};

struct HistoryPoint {
    TimestampMs ts{0};
    double price{0.0};
    double volume{0.0};
    double marketCap{0.0};
};

struct HistorySeries {
    Symbol symbol;
    Timeframe timeframe{Timeframe::OneDay};
    std::vector<HistoryPoint> points;
    TimestampMs generatedAt{0};
    // Interpolation starts here and ends at the quote price.
    double startPrice{0.0};
    std::string source;
    // Series are interpolated from a single quote, never downloaded.
    bool synthetic{true};

    bool empty() const noexcept { return points.empty(); }
    std::size_t size() const noexcept { return points.size(); }
};

struct GlobalMetrics {
    double totalMarketCap{0.0};
    double totalVolume24h{0.0};
    double btcDominance{0.0};
    double ethDominance{0.0};
    std::size_t assetCount{0};
    TimestampMs lastUpdated{0};
};

}  // namespace domain
