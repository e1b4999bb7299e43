#pragma once

namespace core {

class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    // Uniform draw in [lo, hi].
    virtual double uniform(double lo, double hi) = 0;
};

}  // namespace core
