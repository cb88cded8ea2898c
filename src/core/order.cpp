#include "core/order.h"

namespace matchbook {

OrderStatus deriveStatus(Quantity original_quantity, Quantity remaining_quantity,
                         bool explicitly_canceled) {
    // A cancel zeroes the ledger quantity, so it must win over FILLED.
    if (explicitly_canceled)
        return OrderStatus::CANCELED;
    if (remaining_quantity == 0)
        return OrderStatus::FILLED;
    if (remaining_quantity < original_quantity)
        return OrderStatus::PARTIAL;
    return OrderStatus::OPEN;
}

}  // namespace matchbook
