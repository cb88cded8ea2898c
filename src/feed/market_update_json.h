#pragma once

#include "core/records.h"

#include <string>

namespace matchbook {

/// Encode an update as a single-line JSON object:
///   {"type":"market_update","tsNs":..,"book":{"buy":[..],"sell":[..]},"trades":[..]}
/// Prices are JSON numbers with 2-4 decimals.
std::string encodeMarketUpdateJson(const MarketUpdate& update);

/// Quote and escape `s` as a JSON string literal.
std::string jsonString(const std::string& s);

}  // namespace matchbook
