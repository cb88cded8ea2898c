#pragma once

#include "core/order.h"
#include "core/types.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace matchbook {

/// An execution. Immutable once created; buy/sell ids are assigned by side,
/// not by which order was incoming.
struct Trade {
    uint64_t   sequence = 0;
    OrderId    buy_order_id;
    OrderId    sell_order_id;
    PriceTicks price = 0;
    Quantity   quantity = 0;
    uint64_t   ts_ns = 0;
};

/// Durable projection of an order, as the ledger holds it.
struct LedgerOrder {
    OrderId     id;
    Side        side = Side::BUY;
    PriceTicks  price = 0;
    Quantity    quantity = 0;           // remaining as of the last committed cycle
    Quantity    original_quantity = 0;
    OrderStatus status = OrderStatus::OPEN;
    std::string user_id;
    uint64_t    created_ns = 0;
    uint64_t    updated_ns = 0;
};

/// Quantity/status change of an order already in the ledger.
struct OrderUpdate {
    OrderId     id;
    Quantity    quantity = 0;
    OrderStatus status = OrderStatus::OPEN;
    uint64_t    ts_ns = 0;
};

enum class LedgerRecordType : uint8_t {
    ORDER_PUT    = 1,
    ORDER_UPDATE = 2,
    TRADE        = 3
};

/// One record of a ledger commit. Only the member matching `type` is meaningful.
struct LedgerEntry {
    LedgerRecordType type = LedgerRecordType::ORDER_PUT;
    LedgerOrder      order;
    OrderUpdate      update;
    Trade            trade;
};

inline LedgerEntry makePutEntry(LedgerOrder o) {
    LedgerEntry e;
    e.type = LedgerRecordType::ORDER_PUT;
    e.order = std::move(o);
    return e;
}

inline LedgerEntry makeUpdateEntry(OrderUpdate u) {
    LedgerEntry e;
    e.type = LedgerRecordType::ORDER_UPDATE;
    e.update = std::move(u);
    return e;
}

inline LedgerEntry makeTradeEntry(Trade t) {
    LedgerEntry e;
    e.type = LedgerRecordType::TRADE;
    e.trade = std::move(t);
    return e;
}

/// Everything one match or cancel cycle writes. Committed as a unit.
struct LedgerCycle {
    uint64_t                 cycle = 0;   // assigned by Ledger::commit
    uint64_t                 ts_ns = 0;
    std::vector<LedgerEntry> entries;
};

/// Resting orders per side, best price first, FIFO within a price.
struct BookSnapshot {
    std::vector<Order> buy;
    std::vector<Order> sell;
};

/// Payload handed to the market feed after a successful cycle.
struct MarketUpdate {
    uint64_t           ts_ns = 0;
    BookSnapshot       book;
    std::vector<Trade> trades;   // newest first
};

}  // namespace matchbook
