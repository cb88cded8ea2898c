#pragma once

#include "ledger/ledger.h"
#include "matching/order_book.h"
#include "core/order.h"
#include "core/records.h"

#include <cstdint>
#include <vector>

namespace matchbook {

/// Turns the outcome of a match or cancel into one ledger commit.
///
/// Runs inside the serialization gate, after the book mutation. Counterparty
/// quantities are read back from the book as it stands after matching, so the
/// ledger records the same remaining quantity the book holds (0 once an order
/// has left the book). Every write of a cycle goes out as a single commit.
class LedgerReconciler {
public:
    explicit LedgerReconciler(Ledger& ledger) : ledger_(ledger) {}

    /// Records the incoming order's final state, then each trade followed by
    /// the counterparty it touched. Returns the incoming order as committed.
    /// Throws PersistenceError if the commit fails.
    LedgerOrder reconcileSubmission(const Order& incoming,
                                    const std::vector<Trade>& trades,
                                    const OrderBook& book,
                                    uint64_t ts_ns);

    /// Records `existing` as CANCELED with quantity 0.
    LedgerOrder reconcileCancel(const LedgerOrder& existing, uint64_t ts_ns);

    /// The cycle reconcileSubmission() would commit, without committing it.
    LedgerCycle buildSubmissionCycle(const Order& incoming,
                                     const std::vector<Trade>& trades,
                                     const OrderBook& book,
                                     uint64_t ts_ns) const;

private:
    Ledger& ledger_;
};

}  // namespace matchbook
