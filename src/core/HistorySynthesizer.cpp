#include "core/HistorySynthesizer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace core {
namespace {

constexpr double kVolumeJitterLow = 0.5;
constexpr double kVolumeJitterHigh = 1.5;

}  // namespace

HistorySynthesizer::HistorySynthesizer(IRandomSource& random, const IClock& clock)
    : random_(random), clock_(clock) {}

double HistorySynthesizer::startPrice_(double currentPrice, const domain::TimeframeConfig& config) const {
    const double spread = random_.uniform(config.minSpread, config.maxSpread);
    if (config.direction == domain::SpreadDirection::Below) {
        return currentPrice * (1.0 - spread);
    }
    const double sign = random_.uniform(0.0, 1.0) < 0.5 ? -1.0 : 1.0;
    return currentPrice * (1.0 + sign * spread);
}

domain::HistorySeries HistorySynthesizer::synthesize(const domain::Quote& quote,
                                                     domain::Timeframe timeframe) const {
    if (!std::isfinite(quote.price) || quote.price <= 0.0) {
        throw std::invalid_argument("Cannot synthesize history for " + quote.symbol +
                                    ": price must be positive, got " + std::to_string(quote.price));
    }

    const auto& config = domain::timeframeConfig(timeframe);
    const auto now = clock_.nowMs();
    const double current = quote.price;
    const double start = startPrice_(current, config);
    const double supply = quote.marketCap > 0.0 ? quote.marketCap / current : 0.0;
    const double volumeShare = std::isfinite(quote.volume24h) && quote.volume24h > 0.0
                                   ? quote.volume24h * static_cast<double>(config.intervalMs) /
                                         static_cast<double>(domain::kDayMs)
                                   : 0.0;

    domain::HistorySeries series;
    series.symbol = quote.symbol;
    series.timeframe = timeframe;
    series.generatedAt = now;
    series.startPrice = start;
    series.source = quote.source;
    series.synthetic = true;
    series.points.reserve(config.pointCount);

    const std::size_t last = config.pointCount - 1;
    for (std::size_t i = 0; i < config.pointCount; ++i) {
        domain::HistoryPoint point;
        point.ts = now - static_cast<domain::TimestampMs>(last - i) * config.intervalMs;

        if (i == last) {
            point.price = current;
        } else {
            const double progress = last == 0 ? 1.0 : static_cast<double>(i) / static_cast<double>(last);
            const double base = start + (current - start) * progress;
            point.price = base * (1.0 + random_.uniform(-config.maxVariation, config.maxVariation));
        }

        point.volume = volumeShare > 0.0 ? volumeShare * random_.uniform(kVolumeJitterLow, kVolumeJitterHigh) : 0.0;
        point.marketCap = point.price * supply;
        series.points.push_back(point);
    }

    return series;
}

}  // namespace core
