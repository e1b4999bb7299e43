#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/ports/IClock.hpp"
#include "domain/ports/IQuoteSource.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::coingecko {

class CoinGeckoAdapter : public domain::IQuoteSource {
public:
    struct Options {
        std::string quoteCurrency = "usd";
        std::chrono::milliseconds timeout{10000};
    };

    CoinGeckoAdapter(Options options, const core::IClock& clock, infra::http::HttpsGetter getter);
    ~CoinGeckoAdapter() override = default;

    std::string id() const override { return kId; }
    std::vector<domain::Quote> fetch_quotes(const domain::QuoteRequest& request) override;

    // Normalizes a /coins/markets payload. Throws std::runtime_error when the
    // payload is not an array of objects or a row lacks its identity fields.
    static std::vector<domain::Quote> parse_markets(const std::string& body, domain::TimestampMs fetchedAtMs);

    static constexpr const char* kId = "coingecko";
    static constexpr std::size_t kMaxPerPage = 250;

private:
    std::vector<domain::Quote> get_markets_(const std::string& target);

    Options options_;
    const core::IClock& clock_;
    infra::http::HttpsGetter getter_;
};

}  // namespace adapters::coingecko
