#include "core/price.h"
#include "core/errors.h"

#include <cctype>
#include <cstdio>
#include <limits>

namespace matchbook {

namespace {

constexpr int kMaxFractionDigits = 4;

}  // namespace

PriceTicks parsePrice(const std::string& text) {
    if (text.empty())
        throw ValidationError("price is required");

    PriceTicks whole = 0;
    PriceTicks frac = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (char c : text) {
        if (c == '.') {
            if (seen_dot)
                throw ValidationError("price is not a number: " + text);
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw ValidationError("price is not a number: " + text);
        seen_digit = true;

        const int digit = c - '0';
        if (seen_dot) {
            if (++frac_digits > kMaxFractionDigits)
                throw ValidationError("price has more than 4 decimal places: " + text);
            frac = frac * 10 + digit;
        } else {
            if (whole > (std::numeric_limits<PriceTicks>::max() / kPriceScale - digit) / 10)
                throw ValidationError("price out of range: " + text);
            whole = whole * 10 + digit;
        }
    }

    if (!seen_digit)
        throw ValidationError("price is not a number: " + text);

    for (int i = frac_digits; i < kMaxFractionDigits; ++i)
        frac *= 10;

    if (whole > (std::numeric_limits<PriceTicks>::max() - frac) / kPriceScale)
        throw ValidationError("price out of range: " + text);

    const PriceTicks ticks = whole * kPriceScale + frac;
    if (ticks <= 0)
        throw ValidationError("price must be > 0");
    return ticks;
}

std::string formatPrice(PriceTicks ticks) {
    const bool negative = ticks < 0;
    const unsigned long long abs_ticks = negative
        ? static_cast<unsigned long long>(-(ticks + 1)) + 1
        : static_cast<unsigned long long>(ticks);
    const unsigned long long whole = abs_ticks / kPriceScale;
    unsigned long long frac = abs_ticks % kPriceScale;

    // Drop trailing zeros beyond the cents.
    int digits = kMaxFractionDigits;
    while (digits > 2 && frac % 10 == 0) {
        frac /= 10;
        --digits;
    }

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%llu.%0*llu",
                  negative ? "-" : "", whole, digits, frac);
    return buf;
}

PriceTicks roundToCents(PriceTicks ticks) {
    constexpr PriceTicks kCent = kPriceScale / 100;
    const PriceTicks half = kCent / 2;
    if (ticks >= 0)
        return ((ticks + half) / kCent) * kCent;
    return -(((-ticks + half) / kCent) * kCent);
}

}  // namespace matchbook
