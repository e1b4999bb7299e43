#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include "core/ports/IRandomSource.hpp"

namespace core {

class MersenneRandomSource final : public IRandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(std::uint64_t seed);

    double uniform(double lo, double hi) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

}  // namespace core
