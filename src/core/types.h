#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace matchbook {

/// Fixed-point price: kPriceScale ticks per currency unit (5.00 == 50000).
using PriceTicks = int64_t;
using Quantity   = uint64_t;
using OrderId    = std::string;

inline constexpr PriceTicks kPriceScale = 10000;

enum class Side : uint8_t {
    BUY  = 0,
    SELL = 1
};

enum class OrderStatus : uint8_t {
    OPEN     = 0,
    PARTIAL  = 1,
    FILLED   = 2,
    CANCELED = 3
};

inline Side opposite(Side s) {
    return s == Side::BUY ? Side::SELL : Side::BUY;
}

inline const char* sideName(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

inline const char* statusName(OrderStatus s) {
    switch (s) {
        case OrderStatus::OPEN:     return "OPEN";
        case OrderStatus::PARTIAL:  return "PARTIAL";
        case OrderStatus::FILLED:   return "FILLED";
        case OrderStatus::CANCELED: return "CANCELED";
    }
    return "UNKNOWN";
}

/// Wall-clock nanoseconds since the Unix epoch.
inline uint64_t wallClockNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}  // namespace matchbook
