#pragma once

#include "core/order.h"
#include "core/records.h"
#include "matching/order_book.h"

#include <cstdint>
#include <map>
#include <vector>

namespace matchbook {

/// Outcome of matching one incoming order.
struct MatchResult {
    std::vector<Trade>           trades;    // execution order
    std::map<OrderId, Quantity>  touched;   // resting id -> remaining (0 = consumed)
    bool                         rested = false;
};

class IMatchingEngine {
public:
    virtual ~IMatchingEngine() = default;

    /// Match `incoming` against `book`, mutating both. On return
    /// `incoming.quantity` is its unmatched remainder; a nonzero remainder
    /// has been inserted into the book.
    virtual MatchResult match(Order& incoming, OrderBook& book, uint64_t ts_ns) = 0;
};

/// Greedy price-time matching: the best opposing order is recomputed after
/// every fill, trades execute at the resting order's price, and only the
/// opposite side is searched (no self-match across sides).
///
/// Assumes validated input (positive price and quantity).
class PriceTimeMatchingEngine : public IMatchingEngine {
public:
    MatchResult match(Order& incoming, OrderBook& book, uint64_t ts_ns) override;

    /// Sequence assigned to the next trade. Restored from the ledger on restart.
    void setNextTradeSequence(uint64_t seq) { next_trade_sequence_ = seq; }
    uint64_t nextTradeSequence() const { return next_trade_sequence_; }

private:
    uint64_t next_trade_sequence_ = 1;
};

}  // namespace matchbook
