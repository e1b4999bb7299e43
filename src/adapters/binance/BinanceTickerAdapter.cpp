#include "adapters/binance/BinanceTickerAdapter.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "adapters/json/JsonFields.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::binance {

namespace {
constexpr const char* kHost = "api.binance.com";
constexpr const char* kTarget = "/api/v3/ticker/24hr";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

BinanceTickerAdapter::BinanceTickerAdapter(Options options,
                                           const core::IClock& clock,
                                           infra::http::HttpsGetter getter)
    : options_(std::move(options)), clock_(clock), getter_(std::move(getter)) {
    if (!getter_) {
        getter_ = infra::http::default_getter();
    }
    if (options_.quoteAsset.empty()) {
        options_.quoteAsset = "USDT";
    }
}

std::vector<domain::Quote> BinanceTickerAdapter::parse_tickers(const std::string& body,
                                                               const std::string& quoteAsset,
                                                               domain::TimestampMs fetchedAtMs) {
    boost::json::value document;
    try {
        document = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse Binance response: "} + ex.what());
    }

    if (!document.is_array()) {
        throw std::runtime_error("Unexpected Binance response type (expected array)");
    }

    std::vector<domain::Quote> quotes;
    for (const auto& tickerValue : document.as_array()) {
        if (!tickerValue.is_object()) {
            throw std::runtime_error("Unexpected Binance ticker row type");
        }
        const auto& ticker = tickerValue.as_object();

        const auto pair = json::string_or(ticker, "symbol");
        if (!endsWith(pair, quoteAsset)) {
            continue;
        }

        const double lastPrice = json::to_double(json::required(ticker, "lastPrice"));
        const double quoteVolume = json::number_or(ticker, "quoteVolume");
        const auto tradeCount = json::integer_or(ticker, "count");
        // Delisted and halted pairs keep reporting a zero ticker.
        if (tradeCount == 0 || (lastPrice == 0.0 && quoteVolume == 0.0)) {
            continue;
        }

        domain::Quote quote{};
        quote.symbol = pair.substr(0, pair.size() - quoteAsset.size());
        quote.name = quote.symbol;
        quote.price = lastPrice;
        quote.change24h = json::number_or(ticker, "priceChange");
        quote.changePercent24h = json::number_or(ticker, "priceChangePercent");
        quote.volume24h = quoteVolume;
        quote.marketCap = 0.0;
        const auto closeTime = json::integer_or(ticker, "closeTime", fetchedAtMs);
        quote.lastUpdated = closeTime > 0 ? closeTime : fetchedAtMs;
        quote.source = kId;
        quotes.push_back(std::move(quote));
    }

    std::stable_sort(quotes.begin(), quotes.end(), [](const domain::Quote& lhs, const domain::Quote& rhs) {
        return lhs.volume24h > rhs.volume24h;
    });
    std::int32_t rank = 0;
    for (auto& quote : quotes) {
        quote.rank = ++rank;
    }
    return quotes;
}

std::vector<domain::Quote> BinanceTickerAdapter::fetch_quotes(const domain::QuoteRequest& request) {
    LOG_DEBUG("Binance REST " << kTarget);

    infra::http::JsonResponse response;
    {
        mkt::common::metrics::Registry::ScopedTimer timer(std::string{"fetch."} + kId);
        response = getter_(kHost, kTarget, options_.timeout);
    }

    if (response.status == 429U || response.status == 418U) {
        std::ostringstream oss;
        oss << "Binance rate limit hit (HTTP " << response.status << ")";
        if (!response.retry_after_header.empty()) {
            oss << ", retry after " << response.retry_after_header << "s";
        }
        throw std::runtime_error(oss.str());
    }
    if (response.status != 200U) {
        throw std::runtime_error(std::string{"Binance request "} + kTarget + " returned unexpected HTTP " +
                                 std::to_string(response.status));
    }

    auto selected = domain::select_for_request(
        parse_tickers(response.body, options_.quoteAsset, clock_.nowMs()), request);
    if (selected.empty()) {
        throw std::runtime_error("Binance returned no quotes for the request");
    }
    for (const auto& quote : selected) {
        if (!quote.valid()) {
            throw std::runtime_error("Binance returned an invalid price for " + quote.symbol);
        }
    }
    return selected;
}

}  // namespace adapters::binance
