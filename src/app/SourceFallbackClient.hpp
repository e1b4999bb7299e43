#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ports/IClock.hpp"
#include "domain/MarketTypes.hpp"
#include "domain/ports/IQuoteSource.hpp"

namespace app {

struct ProviderSlot {
    std::shared_ptr<domain::IQuoteSource> source;
    std::chrono::milliseconds cooldown{0};
};

struct SourceAttempt {
    std::string providerId;
    bool ok{false};
    bool fromCache{false};
    std::string reason;
};

struct FetchResult {
    std::vector<domain::Quote> quotes;
    std::string source;
    std::vector<SourceAttempt> attempts;

    bool usedReference() const { return source == domain::kReferenceFallbackSource; }
    // True when the winning provider answered from its cooldown cache.
    bool replayed() const { return !attempts.empty() && attempts.back().ok && attempts.back().fromCache; }
};

// Walks the providers in priority order and returns the first usable answer.
// A provider asked again within its cooldown is served from its last
// answer instead of the network, provided that answer was a success. When every provider fails the
// compiled-in reference table is returned, so the result is never empty.
class SourceFallbackClient {
public:
    SourceFallbackClient(std::vector<ProviderSlot> providers, const core::IClock& clock);

    FetchResult fetch_quotes(const domain::QuoteRequest& request);

    // Time of the last real network attempt, if any.
    std::optional<domain::TimestampMs> last_attempt_ms(const std::string& providerId) const;
    std::vector<std::string> provider_ids() const;

private:
    struct ProviderState {
        ProviderSlot slot;
        std::string id;
        std::optional<domain::TimestampMs> lastAttemptMs;
        std::optional<std::vector<domain::Quote>> lastGood;
    };

    enum class Admission { Attempt, Cooldown };

    Admission admit_(ProviderState& state, domain::TimestampMs now);
    SourceAttempt try_network_(ProviderState& state,
                               const domain::QuoteRequest& request,
                               std::vector<domain::Quote>& out);
    SourceAttempt try_cached_(const ProviderState& state,
                              const domain::QuoteRequest& request,
                              std::vector<domain::Quote>& out) const;

    const core::IClock& clock_;
    mutable std::mutex mutex_;
    std::vector<ProviderState> providers_;
};

}  // namespace app
