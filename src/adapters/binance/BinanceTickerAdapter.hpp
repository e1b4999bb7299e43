#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/ports/IClock.hpp"
#include "domain/ports/IQuoteSource.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

// 24h rolling tickers of the USDT spot pairs. Binance has no market cap or
// rank; rank is assigned by descending quote volume.
class BinanceTickerAdapter : public domain::IQuoteSource {
public:
    struct Options {
        std::string quoteAsset = "USDT";
        std::chrono::milliseconds timeout{10000};
    };

    BinanceTickerAdapter(Options options, const core::IClock& clock, infra::http::HttpsGetter getter);
    ~BinanceTickerAdapter() override = default;

    std::string id() const override { return kId; }
    std::vector<domain::Quote> fetch_quotes(const domain::QuoteRequest& request) override;

    static std::vector<domain::Quote> parse_tickers(const std::string& body,
                                                    const std::string& quoteAsset,
                                                    domain::TimestampMs fetchedAtMs);

    static constexpr const char* kId = "binance";

private:
    Options options_;
    const core::IClock& clock_;
    infra::http::HttpsGetter getter_;
};

}  // namespace adapters::binance
