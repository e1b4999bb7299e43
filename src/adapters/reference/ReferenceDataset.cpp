#include "adapters/reference/ReferenceDataset.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace adapters::reference {
namespace {

struct ReferenceAsset {
    const char* symbol;
    const char* name;
    double price;
    double circulatingSupply;
};

constexpr std::array<ReferenceAsset, 10> kAssets{{
    {"BTC", "Bitcoin", 131900.0, 19'800'000.0},
    {"ETH", "Ethereum", 4280.0, 120'000'000.0},
    {"BNB", "BNB", 745.0, 155'000'000.0},
    {"SOL", "Solana", 195.0, 470'000'000.0},
    {"XRP", "XRP", 2.85, 57'000'000'000.0},
    {"USDT", "Tether", 1.00, 140'000'000'000.0},
    {"ADA", "Cardano", 1.45, 35'000'000'000.0},
    {"DOGE", "Dogecoin", 0.385, 146'000'000'000.0},
    {"AVAX", "Avalanche", 42.50, 410'000'000.0},
    {"DOT", "Polkadot", 22.80, 1'400'000'000.0},
}};

double tieredVolume(double price) {
    if (price > 1000.0) {
        return 25'000'000'000.0;
    }
    if (price > 100.0) {
        return 5'000'000'000.0;
    }
    return 1'000'000'000.0;
}

}  // namespace

std::vector<domain::Quote> reference_quotes(const domain::QuoteRequest& request, domain::TimestampMs nowMs) {
    std::vector<domain::Quote> table;
    table.reserve(kAssets.size());

    std::int32_t rank = 0;
    for (const auto& asset : kAssets) {
        domain::Quote quote{};
        quote.symbol = asset.symbol;
        quote.name = asset.name;
        quote.price = asset.price;
        quote.volume24h = tieredVolume(asset.price);
        quote.marketCap = asset.price * asset.circulatingSupply;
        quote.rank = ++rank;
        quote.lastUpdated = nowMs;
        quote.source = domain::kReferenceFallbackSource;
        table.push_back(std::move(quote));
    }

    auto selected = domain::select_for_request(table, request);
    if (selected.empty()) {
        return table;
    }
    return selected;
}

}  // namespace adapters::reference
