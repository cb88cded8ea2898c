#include "matching/matching_engine.h"

#include <algorithm>

namespace matchbook {

MatchResult PriceTimeMatchingEngine::match(Order& incoming, OrderBook& book, uint64_t ts_ns) {
    MatchResult result;

    while (incoming.quantity > 0) {
        const Order* resting = book.bestOpposing(incoming.side, incoming.price);
        if (!resting)
            break;

        // fill() may erase the resting order; copy what we need first.
        const OrderId resting_id = resting->id;
        const Side resting_side = resting->side;
        const PriceTicks trade_price = resting->price;
        const Quantity qty = std::min(incoming.quantity, resting->quantity);

        Trade trade;
        trade.sequence = next_trade_sequence_++;
        trade.buy_order_id = incoming.side == Side::BUY ? incoming.id : resting_id;
        trade.sell_order_id = incoming.side == Side::SELL ? incoming.id : resting_id;
        trade.price = trade_price;
        trade.quantity = qty;
        trade.ts_ns = ts_ns;

        incoming.quantity -= qty;
        result.touched[resting_id] = book.fill(resting_side, resting_id, qty);
        result.trades.push_back(std::move(trade));
    }

    if (incoming.quantity > 0) {
        book.insert(incoming);
        result.rested = true;
    }
    return result;
}

}  // namespace matchbook
