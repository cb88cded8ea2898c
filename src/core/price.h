#pragma once

#include "core/types.h"

#include <string>

namespace matchbook {

/// Parse a positive decimal ("5", "5.00", "0.0001") into ticks.
/// Throws ValidationError on anything else: sign, exponent, more than four
/// fractional digits, zero, overflow.
PriceTicks parsePrice(const std::string& text);

/// Format ticks with at least two and at most four fractional digits.
std::string formatPrice(PriceTicks ticks);

/// Round ticks to the nearest cent (100 ticks), half away from zero.
PriceTicks roundToCents(PriceTicks ticks);

}  // namespace matchbook
