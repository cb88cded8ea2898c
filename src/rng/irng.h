#pragma once

#include <cstdint>

namespace matchbook {

/// Deterministic RNG interface; id generation and the demo market use it so
/// runs are reproducible from a seed.
class IRng {
public:
    virtual ~IRng() = default;
    /// Uniform [0, 1).
    virtual double uniform() = 0;
    /// Uniform integer in [lo, hi], inclusive.
    virtual uint64_t uniformInt(uint64_t lo, uint64_t hi) = 0;
    virtual void seed(uint64_t s) = 0;
};

}  // namespace matchbook
