#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mkt::common {
namespace {

constexpr const char* kCooldownPrefix = "--cooldown.";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(trim(value), &consumed);
        if (consumed != trim(value).size() || parsed == 0U ||
            parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseCount(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(trim(value), &consumed);
        if (consumed != trim(value).size() || parsed == 0U) {
            throw std::out_of_range("count must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::vector<std::string> parseProviders(const std::string& value, const std::string& label) {
    std::vector<std::string> providers;
    for (auto& item : parseCsvList(value)) {
        auto id = toLower(item);
        const auto& known = Config::knownProviders();
        if (std::find(known.begin(), known.end(), id) == known.end()) {
            throw std::runtime_error("Unknown provider in " + label + ": " + item);
        }
        if (std::find(providers.begin(), providers.end(), id) == providers.end()) {
            providers.push_back(std::move(id));
        }
    }
    if (providers.empty()) {
        throw std::runtime_error("Provider list in " + label + " is empty");
    }
    return providers;
}

std::vector<WatchEntry> parseWatchList(const std::string& value) {
    std::vector<WatchEntry> entries;
    for (const auto& item : parseCsvList(value)) {
        const auto colon = item.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= item.size()) {
            throw std::runtime_error("Invalid --watch entry (expected SYMBOL:TIMEFRAME): " + item);
        }
        const auto timeframe = domain::timeframeFromString(trim(item.substr(colon + 1)));
        if (!timeframe) {
            throw std::runtime_error("Unknown timeframe in --watch entry: " + item);
        }
        entries.push_back(WatchEntry{toUpper(trim(item.substr(0, colon))), *timeframe});
    }
    return entries;
}

mkt::log::Level parseLogLevel(const std::string& value, const std::string& label) {
    try {
        return mkt::log::levelFromString(toLower(trim(value)));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

const std::vector<std::string>& Config::knownProviders() {
    static const std::vector<std::string> known{"coingecko", "binance"};
    return known;
}

std::uint32_t Config::cooldownFor(const std::string& providerId) const {
    const auto it = providerCooldownOverridesMs.find(providerId);
    return it == providerCooldownOverridesMs.end() ? providerCooldownMs : it->second;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLogLevel(envLogLevel, "LOG_LEVEL");
    }
    if (const char* envProviders = std::getenv("MARKET_PROVIDERS")) {
        config.providers = parseProviders(envProviders, "MARKET_PROVIDERS");
    }
    if (const char* envCooldown = std::getenv("PROVIDER_COOLDOWN_MS")) {
        config.providerCooldownMs = parseDurationMs(envCooldown, "PROVIDER_COOLDOWN_MS");
    }
    if (const char* envTimeout = std::getenv("PROVIDER_TIMEOUT_MS")) {
        config.providerTimeoutMs = parseDurationMs(envTimeout, "PROVIDER_TIMEOUT_MS");
    }
    if (const char* envInterval = std::getenv("REFRESH_INTERVAL_MS")) {
        config.refreshIntervalMs = parseDurationMs(envInterval, "REFRESH_INTERVAL_MS");
    }
    if (const char* envTopN = std::getenv("TOP_N")) {
        config.topN = parseCount(envTopN, "TOP_N");
    }
    if (const char* envTtl = std::getenv("QUOTE_TTL_MS")) {
        config.quoteTtlMs = parseDurationMs(envTtl, "QUOTE_TTL_MS");
    }
    if (const char* envAuto = std::getenv("AUTO_REFRESH")) {
        config.autoRefresh = parseBool(envAuto, "AUTO_REFRESH");
    }
    if (const char* envCurrency = std::getenv("QUOTE_CURRENCY")) {
        auto currency = toLower(trim(envCurrency));
        if (!currency.empty()) {
            config.quoteCurrency = std::move(currency);
        }
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLogLevel(levelArg, "--log-level");
    }
    if (auto providersArg = valueFromArgs(argc, argv, "--providers"); !providersArg.empty()) {
        config.providers = parseProviders(providersArg, "--providers");
    }
    if (auto cooldownArg = valueFromArgs(argc, argv, "--provider-cooldown-ms"); !cooldownArg.empty()) {
        config.providerCooldownMs = parseDurationMs(cooldownArg, "--provider-cooldown-ms");
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--provider-timeout-ms"); !timeoutArg.empty()) {
        config.providerTimeoutMs = parseDurationMs(timeoutArg, "--provider-timeout-ms");
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--refresh-interval-ms"); !intervalArg.empty()) {
        config.refreshIntervalMs = parseDurationMs(intervalArg, "--refresh-interval-ms");
    }
    if (auto topNArg = valueFromArgs(argc, argv, "--top-n"); !topNArg.empty()) {
        config.topN = parseCount(topNArg, "--top-n");
    }
    if (auto ttlArg = valueFromArgs(argc, argv, "--quote-ttl-ms"); !ttlArg.empty()) {
        config.quoteTtlMs = parseDurationMs(ttlArg, "--quote-ttl-ms");
    }
    if (auto autoArg = valueFromArgs(argc, argv, "--auto-refresh"); !autoArg.empty()) {
        config.autoRefresh = parseBool(autoArg, "--auto-refresh");
    }
    if (auto watchArg = valueFromArgs(argc, argv, "--watch"); !watchArg.empty()) {
        config.watch = parseWatchList(watchArg);
    }
    if (auto currencyArg = valueFromArgs(argc, argv, "--quote-currency"); !currencyArg.empty()) {
        config.quoteCurrency = toLower(trim(currencyArg));
    }

    // --cooldown.<id>=<ms>
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg.rfind(kCooldownPrefix, 0) != 0) {
            continue;
        }
        const auto equals = arg.find('=');
        if (equals == std::string::npos) {
            throw std::runtime_error("Expected --cooldown.<provider>=<ms>: " + arg);
        }
        const auto id = toLower(arg.substr(std::char_traits<char>::length(kCooldownPrefix),
                                           equals - std::char_traits<char>::length(kCooldownPrefix)));
        const auto& known = knownProviders();
        if (std::find(known.begin(), known.end(), id) == known.end()) {
            throw std::runtime_error("Unknown provider in " + arg.substr(0, equals));
        }
        config.providerCooldownOverridesMs[id] = parseDurationMs(arg.substr(equals + 1), arg.substr(0, equals));
    }

    if (config.quoteCurrency.empty()) {
        throw std::runtime_error("Quote currency must not be empty");
    }

    return config;
}

}  // namespace mkt::common
