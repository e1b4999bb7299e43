#pragma once

#include <chrono>

#include "domain/MarketTypes.hpp"

namespace core {

class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::TimestampMs nowMs() const = 0;
};

class SystemClock final : public IClock {
public:
    domain::TimestampMs nowMs() const override {
        const auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }
};

}  // namespace core
