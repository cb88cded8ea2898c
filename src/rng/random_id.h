#pragma once

#include "rng/irng.h"

#include <cstddef>
#include <string>

namespace matchbook {

/// `prefix` followed by `length` random characters from [0-9a-z].
std::string randomId(IRng& rng, const std::string& prefix, size_t length = 7);

}  // namespace matchbook
