#include "app/ProviderFactory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "adapters/binance/BinanceTickerAdapter.hpp"
#include "adapters/coingecko/CoinGeckoAdapter.hpp"
#include "common/Log.hpp"

namespace app {

std::vector<ProviderSlot> build_providers(const mkt::common::Config& config,
                                          const core::IClock& clock,
                                          infra::http::HttpsGetter getter) {
    const std::chrono::milliseconds timeout{config.providerTimeoutMs};

    std::vector<ProviderSlot> slots;
    slots.reserve(config.providers.size());
    for (const auto& id : config.providers) {
        ProviderSlot slot;
        slot.cooldown = std::chrono::milliseconds{config.cooldownFor(id)};

        if (id == adapters::coingecko::CoinGeckoAdapter::kId) {
            adapters::coingecko::CoinGeckoAdapter::Options options;
            options.quoteCurrency = config.quoteCurrency;
            options.timeout = timeout;
            slot.source = std::make_shared<adapters::coingecko::CoinGeckoAdapter>(options, clock, getter);
        } else if (id == adapters::binance::BinanceTickerAdapter::kId) {
            adapters::binance::BinanceTickerAdapter::Options options;
            options.timeout = timeout;
            slot.source = std::make_shared<adapters::binance::BinanceTickerAdapter>(options, clock, getter);
        } else {
            throw std::runtime_error("Unknown market data provider: " + id);
        }

        LOG_INFO("Provider " << slots.size() + 1 << ": " << id << " cooldown_ms=" << slot.cooldown.count());
        slots.push_back(std::move(slot));
    }
    return slots;
}

}  // namespace app
