#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/MarketTypes.hpp"

namespace domain {

// What one refresh round asks a provider for: the top-N assets by rank plus
// every explicitly listed symbol the provider knows. topN == 0 asks only for
// the listed symbols.
struct QuoteRequest {
    std::size_t topN{0};
    std::vector<Symbol> symbols;
};

// One adapter per upstream provider. Implementations throw
// std::runtime_error on network, HTTP, payload or validation failures.
class IQuoteSource {
public:
    virtual ~IQuoteSource() = default;

    virtual std::string id() const = 0;
    virtual std::vector<Quote> fetch_quotes(const QuoteRequest& request) = 0;
};

std::vector<Quote> select_for_request(std::vector<Quote> quotes, const QuoteRequest& request);

}  // namespace domain
