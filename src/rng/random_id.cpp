#include "rng/random_id.h"

namespace matchbook {

std::string randomId(IRng& rng, const std::string& prefix, size_t length) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string id = prefix;
    id.reserve(prefix.size() + length);
    for (size_t i = 0; i < length; ++i)
        id.push_back(kAlphabet[rng.uniformInt(0, 35)]);
    return id;
}

}  // namespace matchbook
