#pragma once

#include "core/order.h"
#include "core/records.h"
#include "core/types.h"

#include <deque>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace matchbook {

/// Resting limit orders for one instrument, split by side.
///
/// Each side is a price-keyed map of FIFO queues, so the best opposing order
/// is the front of the first qualifying level. Invariants: ids are unique
/// across both sides, and no resting order has quantity 0 (fill() removes an
/// order the moment it is exhausted).
///
/// Not thread-safe; the engine serializes writers and guards readers.
class OrderBook {
public:
    /// Append `order` to the back of its price level and stamp its arrival
    /// sequence. Throws InvalidStateError if quantity is 0 or the id is
    /// already resting.
    void insert(Order order);

    /// Remove and return the order; no-op when absent (idempotent).
    std::optional<Order> removeById(Side side, const OrderId& id);
    std::optional<Order> removeById(const OrderId& id);

    /// Best resting order on the side opposite to `side` that `limit_price`
    /// crosses: lowest sell <= limit for a buy, highest buy >= limit for a
    /// sell; earliest arrival within a price. nullptr when nothing qualifies.
    /// The pointer is invalidated by the next mutation.
    const Order* bestOpposing(Side side, PriceTicks limit_price) const;

    /// Reduce a resting order by `qty` and return what remains; an order that
    /// reaches 0 is removed. Throws InvalidStateError if the id is not resting
    /// or `qty` exceeds its remaining quantity.
    Quantity fill(Side side, const OrderId& id, Quantity qty);

    const Order* find(const OrderId& id) const;
    bool contains(const OrderId& id) const { return index_.count(id) != 0; }

    std::optional<PriceTicks> bestBid() const;
    std::optional<PriceTicks> bestAsk() const;

    /// Aggregated (price, total quantity) levels, best price first.
    std::vector<std::pair<PriceTicks, Quantity>> depth(Side side) const;

    BookSnapshot snapshot() const;

    size_t orderCount() const { return index_.size(); }
    bool empty() const { return index_.empty(); }

    void clear();

private:
    using Level = std::deque<Order>;
    using Ladder = std::map<PriceTicks, Level>;

    Ladder& sideMap(Side side) { return side == Side::BUY ? bids_ : asks_; }
    const Ladder& sideMap(Side side) const { return side == Side::BUY ? bids_ : asks_; }

    Order* locate(Side side, PriceTicks price, const OrderId& id);

    // Both maps ascend by price; the best bid is bids_.rbegin().
    Ladder bids_;
    Ladder asks_;
    std::unordered_map<OrderId, std::pair<Side, PriceTicks>> index_;
    uint64_t next_sequence_ = 1;
};

}  // namespace matchbook
