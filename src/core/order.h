#pragma once

#include "core/types.h"

#include <string>

namespace matchbook {

/// A limit order as the book sees it. `quantity` is what remains unmatched;
/// `original_quantity` is fixed at submission.
struct Order {
    OrderId     id;
    Side        side = Side::BUY;
    PriceTicks  price = 0;
    Quantity    quantity = 0;
    Quantity    original_quantity = 0;
    std::string user_id;        // empty = no owner (demo / anonymous)
    uint64_t    sequence = 0;   // arrival number, assigned by OrderBook::insert

    bool isFilled() const { return quantity == 0; }
    Quantity filledQuantity() const {
        return original_quantity > quantity ? original_quantity - quantity : 0;
    }
};

/// The single place order status is derived. Status is never stored
/// independently of the quantities it is computed from.
OrderStatus deriveStatus(Quantity original_quantity, Quantity remaining_quantity,
                         bool explicitly_canceled);

}  // namespace matchbook
