#include "app/SourceFallbackClient.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "adapters/reference/ReferenceDataset.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {

using mkt::common::metrics::Registry;

void validateQuotes(const std::vector<domain::Quote>& quotes) {
    if (quotes.empty()) {
        throw std::runtime_error("empty response");
    }
    const auto bad = std::find_if(quotes.begin(), quotes.end(), [](const domain::Quote& q) { return !q.valid(); });
    if (bad != quotes.end()) {
        throw std::runtime_error("invalid quote for '" + bad->symbol + "'");
    }
}

}  // namespace

SourceFallbackClient::SourceFallbackClient(std::vector<ProviderSlot> providers, const core::IClock& clock)
    : clock_(clock) {
    providers_.reserve(providers.size());
    for (auto& slot : providers) {
        if (!slot.source) {
            throw std::invalid_argument("SourceFallbackClient: null provider");
        }
        ProviderState state;
        state.id = slot.source->id();
        state.slot = std::move(slot);
        providers_.push_back(std::move(state));
    }
}

SourceFallbackClient::Admission SourceFallbackClient::admit_(ProviderState& state, domain::TimestampMs now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state.lastAttemptMs && now - *state.lastAttemptMs < state.slot.cooldown.count()) {
        return Admission::Cooldown;
    }
    // Stamped before the call so concurrent rounds see the provider as busy.
    state.lastAttemptMs = now;
    return Admission::Attempt;
}

SourceAttempt SourceFallbackClient::try_network_(ProviderState& state,
                                                 const domain::QuoteRequest& request,
                                                 std::vector<domain::Quote>& out) {
    SourceAttempt attempt{state.id, false, false, {}};
    try {
        auto quotes = state.slot.source->fetch_quotes(request);
        validateQuotes(quotes);
        for (auto& quote : quotes) {
            if (quote.source.empty()) {
                quote.source = state.id;
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state.lastGood = quotes;
        }
        out = std::move(quotes);
        attempt.ok = true;
    } catch (const std::exception& ex) {
        attempt.reason = ex.what();
        std::lock_guard<std::mutex> lock(mutex_);
        state.lastGood.reset();
    }
    return attempt;
}

SourceAttempt SourceFallbackClient::try_cached_(const ProviderState& state,
                                                const domain::QuoteRequest& request,
                                                std::vector<domain::Quote>& out) const {
    SourceAttempt attempt{state.id, false, true, {}};
    std::optional<std::vector<domain::Quote>> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached = state.lastGood;
    }
    if (!cached) {
        attempt.reason = "cooldown active and no previous result";
        return attempt;
    }
    auto selected = domain::select_for_request(std::move(*cached), request);
    if (selected.empty()) {
        attempt.reason = "cooldown active and previous result has no requested symbol";
        return attempt;
    }
    out = std::move(selected);
    attempt.ok = true;
    return attempt;
}

FetchResult SourceFallbackClient::fetch_quotes(const domain::QuoteRequest& request) {
    FetchResult result;
    auto& registry = Registry::instance();

    for (auto& state : providers_) {
        const auto now = clock_.nowMs();
        std::vector<domain::Quote> quotes;
        SourceAttempt attempt;

        if (admit_(state, now) == Admission::Cooldown) {
            registry.incrementCounter("source." + state.id + ".cooldown_hit");
            attempt = try_cached_(state, request, quotes);
        } else {
            attempt = try_network_(state, request, quotes);
        }

        registry.incrementCounter("source." + state.id + (attempt.ok ? ".ok" : ".fail"));
        if (!attempt.ok) {
            LOG_WARN("Source " << state.id << " unavailable: " << attempt.reason);
        } else {
            LOG_DEBUG("Source " << state.id << " returned " << quotes.size() << " quotes"
                                << (attempt.fromCache ? " (cooldown cache)" : ""));
        }
        result.attempts.push_back(std::move(attempt));

        if (result.attempts.back().ok) {
            result.quotes = std::move(quotes);
            result.source = state.id;
            return result;
        }
    }

    registry.incrementCounter("source.exhausted");
    LOG_ERR("All " << providers_.size() << " sources exhausted, serving reference dataset");
    result.quotes = adapters::reference::reference_quotes(request, clock_.nowMs());
    result.source = domain::kReferenceFallbackSource;
    return result;
}

std::optional<domain::TimestampMs> SourceFallbackClient::last_attempt_ms(const std::string& providerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& state : providers_) {
        if (state.id == providerId) {
            return state.lastAttemptMs;
        }
    }
    return std::nullopt;
}

std::vector<std::string> SourceFallbackClient::provider_ids() const {
    std::vector<std::string> ids;
    ids.reserve(providers_.size());
    for (const auto& state : providers_) {
        ids.push_back(state.id);
    }
    return ids;
}

}  // namespace app
