#include "core/MersenneRandomSource.hpp"

#include <utility>

namespace core {

MersenneRandomSource::MersenneRandomSource()
    : engine_(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed)
    : engine_(seed) {}

double MersenneRandomSource::uniform(double lo, double hi) {
    if (hi < lo) {
        std::swap(lo, hi);
    }
    if (lo == hi) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(engine_);
}

}  // namespace core
