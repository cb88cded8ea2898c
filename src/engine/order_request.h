#pragma once

#include "core/types.h"

#include <cstddef>
#include <string>

namespace matchbook {

/// An order as a caller hands it in: raw text fields, not yet trusted.
/// Empty `id` asks the exchange to generate one.
struct OrderRequest {
    std::string id;
    std::string side;       // "buy" | "sell"
    std::string price;      // decimal, e.g. "9.50"
    std::string quantity;   // positive integer
    std::string user_id;
};

/// A validated order, ready for matching.
struct NewOrder {
    OrderId     id;
    Side        side = Side::BUY;
    PriceTicks  price = 0;
    Quantity    quantity = 0;
    std::string user_id;
};

constexpr size_t kMaxIdLength = 64;

/// Largest quantity one order may carry. Keeps per-level and per-book sums
/// far from the Quantity range.
constexpr Quantity kMaxQuantity = 1000000000000ULL;

/// Parse and check every field of `req`. Throws ValidationError naming the
/// first problem found. Does not check id uniqueness.
NewOrder validateOrderRequest(const OrderRequest& req);

/// Range checks for an already-typed order (positive price, quantity in
/// 1..kMaxQuantity, well-formed id). Throws ValidationError.
void validateNewOrder(const NewOrder& order);

/// Ids: 1..kMaxIdLength printable ASCII characters, no whitespace.
bool isValidOrderId(const std::string& id);

}  // namespace matchbook
