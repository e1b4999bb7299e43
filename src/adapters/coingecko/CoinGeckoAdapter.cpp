#include "adapters/coingecko/CoinGeckoAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/json.hpp>

#include "adapters/json/JsonFields.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::coingecko {

namespace {
constexpr const char* kHost = "api.coingecko.com";

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

// CoinGecko lists many tokens under popular tickers; keep the best ranked one.
void keepBestRankedPerSymbol(std::vector<domain::Quote>& quotes) {
    std::unordered_map<std::string, std::size_t> best;
    for (std::size_t i = 0; i < quotes.size(); ++i) {
        auto [it, inserted] = best.try_emplace(quotes[i].symbol, i);
        if (inserted) {
            continue;
        }
        const auto& current = quotes[it->second];
        const bool candidateRanked = quotes[i].rank > 0;
        const bool currentRanked = current.rank > 0;
        if ((candidateRanked && !currentRanked) || (candidateRanked && quotes[i].rank < current.rank)) {
            it->second = i;
        }
    }

    std::vector<domain::Quote> filtered;
    filtered.reserve(best.size());
    for (std::size_t i = 0; i < quotes.size(); ++i) {
        if (best[quotes[i].symbol] == i) {
            filtered.push_back(std::move(quotes[i]));
        }
    }
    quotes = std::move(filtered);
}

}  // namespace

CoinGeckoAdapter::CoinGeckoAdapter(Options options, const core::IClock& clock, infra::http::HttpsGetter getter)
    : options_(std::move(options)), clock_(clock), getter_(std::move(getter)) {
    if (!getter_) {
        getter_ = infra::http::default_getter();
    }
    if (options_.quoteCurrency.empty()) {
        options_.quoteCurrency = "usd";
    }
}

std::vector<domain::Quote> CoinGeckoAdapter::parse_markets(const std::string& body, domain::TimestampMs fetchedAtMs) {
    boost::json::value document;
    try {
        document = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse CoinGecko response: "} + ex.what());
    }

    if (!document.is_array()) {
        throw std::runtime_error("Unexpected CoinGecko response type (expected array)");
    }

    std::vector<domain::Quote> quotes;
    const auto& rows = document.as_array();
    quotes.reserve(rows.size());

    std::int32_t position = 0;
    for (const auto& rowValue : rows) {
        ++position;
        if (!rowValue.is_object()) {
            throw std::runtime_error("Unexpected CoinGecko market row type");
        }
        const auto& row = rowValue.as_object();

        const auto& symbolValue = json::required(row, "symbol");
        if (!symbolValue.is_string()) {
            throw std::runtime_error("CoinGecko market row has a non-string symbol");
        }

        domain::Quote quote{};
        quote.symbol = toUpper(std::string{symbolValue.as_string().c_str()});
        quote.name = json::string_or(row, "name", quote.symbol);
        quote.price = json::number_or(row, "current_price");
        quote.change24h = json::number_or(row, "price_change_24h");
        quote.changePercent24h = json::number_or(row, "price_change_percentage_24h");
        quote.volume24h = json::number_or(row, "total_volume");
        quote.marketCap = json::number_or(row, "market_cap");
        quote.rank = static_cast<std::int32_t>(json::integer_or(row, "market_cap_rank", position));
        quote.lastUpdated = json::iso8601_to_ms(json::string_or(row, "last_updated"), fetchedAtMs);
        quote.source = kId;
        quotes.push_back(std::move(quote));
    }

    keepBestRankedPerSymbol(quotes);
    return quotes;
}

std::vector<domain::Quote> CoinGeckoAdapter::get_markets_(const std::string& target) {
    LOG_DEBUG("CoinGecko REST " << target);

    infra::http::JsonResponse response;
    {
        mkt::common::metrics::Registry::ScopedTimer timer(std::string{"fetch."} + kId);
        response = getter_(kHost, target, options_.timeout);
    }

    if (response.status == 429U) {
        std::ostringstream oss;
        oss << "CoinGecko rate limit hit (HTTP 429)";
        if (!response.retry_after_header.empty()) {
            oss << ", retry after " << response.retry_after_header << "s";
        }
        throw std::runtime_error(oss.str());
    }
    if (response.status != 200U) {
        throw std::runtime_error("CoinGecko request " + target + " returned unexpected HTTP " +
                                 std::to_string(response.status));
    }

    return parse_markets(response.body, clock_.nowMs());
}

std::vector<domain::Quote> CoinGeckoAdapter::fetch_quotes(const domain::QuoteRequest& request) {
    std::vector<domain::Quote> collected;
    std::unordered_set<std::string> seen;

    const auto currency = infra::http::url_encode(toLower(options_.quoteCurrency));

    if (request.topN > 0 || request.symbols.empty()) {
        const auto perPage = std::clamp<std::size_t>(request.topN == 0 ? kMaxPerPage : request.topN, 1, kMaxPerPage);
        std::ostringstream target;
        target << "/api/v3/coins/markets?vs_currency=" << currency << "&order=market_cap_desc&per_page=" << perPage
               << "&page=1&sparkline=false";
        for (auto& quote : get_markets_(target.str())) {
            if (seen.insert(quote.symbol).second) {
                collected.push_back(std::move(quote));
            }
        }
    }

    std::vector<std::string> missing;
    for (const auto& symbol : request.symbols) {
        const auto upper = toUpper(symbol);
        if (!upper.empty() && seen.count(upper) == 0 &&
            std::find(missing.begin(), missing.end(), upper) == missing.end()) {
            missing.push_back(upper);
        }
    }

    if (!missing.empty()) {
        std::string joined;
        for (const auto& symbol : missing) {
            if (!joined.empty()) {
                joined.push_back(',');
            }
            joined += toLower(symbol);
        }
        std::ostringstream target;
        target << "/api/v3/coins/markets?vs_currency=" << currency << "&symbols=" << infra::http::url_encode(joined)
               << "&include_tokens=top&order=market_cap_desc&per_page=" << kMaxPerPage << "&page=1&sparkline=false";
        for (auto& quote : get_markets_(target.str())) {
            if (seen.insert(quote.symbol).second) {
                collected.push_back(std::move(quote));
            }
        }
    }

    if (collected.empty()) {
        throw std::runtime_error("CoinGecko returned no quotes");
    }
    for (const auto& quote : collected) {
        if (!quote.valid()) {
            throw std::runtime_error("CoinGecko returned an invalid price for " + quote.symbol);
        }
    }

    return domain::select_for_request(std::move(collected), request);
}

}  // namespace adapters::coingecko
