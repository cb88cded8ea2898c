#include "ledger/ledger_reconciler.h"

#include <cstdio>
#include <unordered_set>

namespace matchbook {

static LedgerOrder incomingSnapshot(const Order& incoming, uint64_t ts_ns) {
    LedgerOrder o;
    o.id                = incoming.id;
    o.side              = incoming.side;
    o.price             = incoming.price;
    o.quantity          = incoming.quantity;
    o.original_quantity = incoming.original_quantity;
    o.status            = deriveStatus(incoming.original_quantity, incoming.quantity, false);
    o.user_id           = incoming.user_id;
    o.created_ns        = ts_ns;
    o.updated_ns        = ts_ns;
    return o;
}

LedgerCycle LedgerReconciler::buildSubmissionCycle(const Order& incoming,
                                                   const std::vector<Trade>& trades,
                                                   const OrderBook& book,
                                                   uint64_t ts_ns) const {
    LedgerCycle cycle;
    cycle.ts_ns = ts_ns;
    cycle.entries.reserve(1 + 2 * trades.size());
    cycle.entries.push_back(makePutEntry(incomingSnapshot(incoming, ts_ns)));

    std::unordered_set<OrderId> updated;
    for (const auto& t : trades) {
        cycle.entries.push_back(makeTradeEntry(t));

        const OrderId& counterparty =
            incoming.side == Side::BUY ? t.sell_order_id : t.buy_order_id;
        if (!updated.insert(counterparty).second)
            continue;

        Quantity original = 0;
        Quantity remaining = 0;
        if (const Order* resting = book.find(counterparty)) {
            original  = resting->original_quantity;
            remaining = resting->quantity;
        } else if (auto known = ledger_.find(counterparty)) {
            original = known->original_quantity;
        } else {
            std::fprintf(stderr, "[ledger] counterparty %s of trade %llu has no record\n",
                         counterparty.c_str(), static_cast<unsigned long long>(t.sequence));
            continue;
        }

        OrderUpdate u;
        u.id       = counterparty;
        u.quantity = remaining;
        u.status   = deriveStatus(original, remaining, false);
        u.ts_ns    = ts_ns;
        cycle.entries.push_back(makeUpdateEntry(std::move(u)));
    }
    return cycle;
}

LedgerOrder LedgerReconciler::reconcileSubmission(const Order& incoming,
                                                  const std::vector<Trade>& trades,
                                                  const OrderBook& book,
                                                  uint64_t ts_ns) {
    LedgerCycle cycle = buildSubmissionCycle(incoming, trades, book, ts_ns);
    ledger_.commit(cycle);
    return cycle.entries.front().order;
}

LedgerOrder LedgerReconciler::reconcileCancel(const LedgerOrder& existing, uint64_t ts_ns) {
    OrderUpdate u;
    u.id       = existing.id;
    u.quantity = 0;
    u.status   = deriveStatus(existing.original_quantity, 0, true);
    u.ts_ns    = ts_ns;

    LedgerCycle cycle;
    cycle.ts_ns = ts_ns;
    cycle.entries.push_back(makeUpdateEntry(u));
    ledger_.commit(cycle);

    LedgerOrder canceled = existing;
    canceled.quantity   = 0;
    canceled.status     = u.status;
    canceled.updated_ns = ts_ns;
    return canceled;
}

}  // namespace matchbook
