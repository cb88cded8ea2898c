#include "rng/mt19937_rng.h"

#include <utility>

namespace matchbook {

Mt19937Rng::Mt19937Rng(uint64_t seed) : gen_(seed), dist_(0.0, 1.0) {}

double Mt19937Rng::uniform() {
    return dist_(gen_);
}

uint64_t Mt19937Rng::uniformInt(uint64_t lo, uint64_t hi) {
    if (hi < lo)
        std::swap(lo, hi);
    std::uniform_int_distribution<uint64_t> dist(lo, hi);
    return dist(gen_);
}

void Mt19937Rng::seed(uint64_t s) {
    gen_.seed(s);
}

}  // namespace matchbook
