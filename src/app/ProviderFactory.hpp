#pragma once

#include <vector>

#include "app/SourceFallbackClient.hpp"
#include "common/Config.hpp"
#include "core/ports/IClock.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace app {

// Builds the fallback chain in the configured priority order. An empty
// getter selects the TLS client. Throws std::runtime_error on unknown ids.
std::vector<ProviderSlot> build_providers(const mkt::common::Config& config,
                                          const core::IClock& clock,
                                          infra::http::HttpsGetter getter = {});

}  // namespace app
