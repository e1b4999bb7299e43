#pragma once

#include <vector>

#include "domain/MarketTypes.hpp"
#include "domain/ports/IQuoteSource.hpp"

namespace adapters::reference {

// Approximate snapshot of the largest assets, served when every provider in
// the chain has failed. Quotes are tagged domain::kReferenceFallbackSource.
// Never empty: a request matching none of the table returns the full table.
std::vector<domain::Quote> reference_quotes(const domain::QuoteRequest& request, domain::TimestampMs nowMs);

}  // namespace adapters::reference
