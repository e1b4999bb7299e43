#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "app/MarketDataService.hpp"
#include "app/ProviderFactory.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/MersenneRandomSource.hpp"
#include "core/ports/IClock.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined.append(",");
        }
        joined.append(value);
    }
    return joined;
}

void logTopQuotes(const app::MarketDataService& service, const std::string& source) {
    const auto top = service.listQuotes(10);
    LOG_INFO("Top " << top.size() << " quotes (source=" << source << ")");
    for (const auto& quote : top) {
        std::ostringstream line;
        line << std::fixed << std::setprecision(quote.price < 1.0 ? 6 : 2);
        line << "  #" << quote.rank << ' ' << quote.symbol << ' ' << quote.price;
        line << std::setprecision(2) << " (" << quote.changePercent24h << "%)";
        LOG_INFO(line.str());
    }
    if (const auto metrics = service.globalMetrics()) {
        LOG_INFO("  market_cap=" << std::fixed << std::setprecision(0) << metrics->totalMarketCap
                                 << " btc_dominance=" << std::setprecision(2) << metrics->btcDominance << '%');
    }
}

void logMetrics() {
    const auto snapshot = mkt::common::metrics::Registry::instance().snapshot();
    std::map<std::string, std::uint64_t> counters(snapshot.counters.begin(), snapshot.counters.end());
    for (const auto& [key, value] : counters) {
        LOG_INFO("  counter " << key << '=' << value);
    }
    for (const auto& [key, latency] : snapshot.latencies) {
        LOG_INFO("  latency " << key << " samples=" << latency.samples
                              << " p95_ms=" << latency.p95Ms.value_or(0.0) << " p99_ms=" << latency.p99Ms.value_or(0.0));
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        const auto config = mkt::common::Config::fromArgs(argc, argv);
        mkt::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << mkt::log::levelToString(config.logLevel));
        LOG_INFO("  Providers: " << joinList(config.providers));
        LOG_INFO("  Provider cooldown: " << config.providerCooldownMs << " ms, timeout: " << config.providerTimeoutMs
                                         << " ms");
        LOG_INFO("  Refresh interval: " << config.refreshIntervalMs << " ms (auto=" << std::boolalpha
                                        << config.autoRefresh << ")");
        LOG_INFO("  Top N: " << config.topN << ", quote TTL: " << config.quoteTtlMs << " ms");

        core::SystemClock clock;
        core::MersenneRandomSource random;

        app::MarketDataOptions options;
        options.topN = config.topN;
        options.quoteTtl = std::chrono::milliseconds{config.quoteTtlMs};

        app::MarketDataService service(app::build_providers(config, clock), clock, random, options);
        LOG_INFO("Fallback chain: " << joinList(service.sources().provider_ids()) << ",reference-fallback");

        service.addListener([&service](const app::MarketEvent& event) {
            if (const auto* quotes = std::get_if<app::QuotesUpdated>(&event)) {
                logTopQuotes(service, quotes->source);
            } else if (const auto* history = std::get_if<app::HistoryUpdated>(&event)) {
                LOG_DEBUG("History regenerated " << history->symbol << ' '
                                                 << domain::timeframeToString(history->timeframe));
            }
        });

        for (const auto& entry : config.watch) {
            service.subscribeHistory(entry.symbol, entry.timeframe);
            LOG_INFO("Watching " << entry.symbol << ' ' << domain::timeframeToString(entry.timeframe));
        }

        service.refresh();

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        if (config.autoRefresh) {
            service.startAutoRefresh(std::chrono::milliseconds{config.refreshIntervalMs});
        }
        LOG_INFO("Market data service running");

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Signal " << gSignalStatus << " received, shutting down");
        service.stopAutoRefresh();
        logMetrics();
        LOG_INFO("Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
