#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Timeframe.hpp"

namespace mkt::common {

struct WatchEntry {
    std::string symbol;
    domain::Timeframe timeframe{domain::Timeframe::OneDay};
};

struct Config {
    mkt::log::Level logLevel = mkt::log::Level::Info;

    std::vector<std::string> providers{"coingecko", "binance"};
    std::uint32_t providerCooldownMs = 3000;
    std::map<std::string, std::uint32_t> providerCooldownOverridesMs{};
    std::uint32_t providerTimeoutMs = 10000;

    std::uint32_t refreshIntervalMs = 60000;
    std::size_t topN = 50;
    std::uint32_t quoteTtlMs = 300000;
    bool autoRefresh = true;
    std::vector<WatchEntry> watch{};
    std::string quoteCurrency = "usd";

    std::uint32_t cooldownFor(const std::string& providerId) const;

    static const std::vector<std::string>& knownProviders();
    static Config fromArgs(int argc, char** argv);
};

}  // namespace mkt::common
