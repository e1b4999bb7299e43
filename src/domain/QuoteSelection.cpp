#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "domain/ports/IQuoteSource.hpp"

namespace domain {
namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

bool rankedBefore(const Quote& lhs, const Quote& rhs) {
    const bool lhsRanked = lhs.rank > 0;
    const bool rhsRanked = rhs.rank > 0;
    if (lhsRanked != rhsRanked) {
        return lhsRanked;
    }
    if (lhs.rank != rhs.rank) {
        return lhs.rank < rhs.rank;
    }
    return lhs.symbol < rhs.symbol;
}

}  // namespace

std::vector<Quote> select_for_request(std::vector<Quote> quotes, const QuoteRequest& request) {
    std::stable_sort(quotes.begin(), quotes.end(), rankedBefore);
    if (request.topN == 0 && request.symbols.empty()) {
        return quotes;
    }

    std::unordered_set<std::string> wanted;
    for (const auto& symbol : request.symbols) {
        wanted.insert(toUpper(symbol));
    }

    std::vector<Quote> selected;
    std::unordered_set<std::string> taken;
    for (std::size_t position = 0; position < quotes.size(); ++position) {
        auto& quote = quotes[position];
        const bool inTop = position < request.topN;
        const bool requested = wanted.count(toUpper(quote.symbol)) != 0;
        if ((inTop || requested) && taken.insert(quote.symbol).second) {
            selected.push_back(std::move(quote));
        }
    }
    return selected;
}

}  // namespace domain
