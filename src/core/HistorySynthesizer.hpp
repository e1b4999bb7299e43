#pragma once

#include "core/ports/IClock.hpp"
#include "core/ports/IRandomSource.hpp"
#include "domain/MarketTypes.hpp"
#include "domain/Timeframe.hpp"

namespace core {

// Builds a bounded synthetic series for one timeframe out of a single quote.
// The series ends at the clock's now, steps by the timeframe interval and its
// final price equals the quote price exactly.
class HistorySynthesizer {
public:
    HistorySynthesizer(IRandomSource& random, const IClock& clock);

    // Throws std::invalid_argument when the quote price is not a positive
    // finite number.
    domain::HistorySeries synthesize(const domain::Quote& quote, domain::Timeframe timeframe) const;

private:
    double startPrice_(double currentPrice, const domain::TimeframeConfig& config) const;

    IRandomSource& random_;
    const IClock& clock_;
};

}  // namespace core
