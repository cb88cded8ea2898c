#pragma once

#include "engine/order_request.h"
#include "engine/serialization_gate.h"
#include "feed/i_market_sink.h"
#include "ledger/ledger.h"
#include "ledger/ledger_reconciler.h"
#include "matching/matching_engine.h"
#include "matching/order_book.h"
#include "rng/mt19937_rng.h"
#include "core/records.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace matchbook {

struct ExchangeConfig {
    std::string venue         = "matchbook";
    size_t      recent_trades = 50;   // trades carried by each MarketUpdate
    uint64_t    seed          = 0;    // order-id generation; 0 = seed from the clock
};

struct SubmitResult {
    LedgerOrder        order;    // incoming order as committed
    std::vector<Trade> trades;   // this cycle's trades, execution order
    BookSnapshot       book;     // book right after the cycle
};

/// Single-instrument venue: order book, price-time matching and the ledger,
/// kept consistent by running every submit and cancel as one gated cycle:
///
///   validate -> [gate] match (book write lock) -> commit to ledger -> publish
///
/// Readers (snapshot, depth, trades, order lookups) bypass the gate and take
/// shared locks, so they see a book either before or after a cycle's
/// mutation.
///
/// If the ledger commit fails the book is not rolled back: the caller gets a
/// PersistenceError and the failure is counted. Resubmitting the same order
/// would match it a second time.
class Exchange {
public:
    /// Takes ownership of `ledger`; an existing ledger is not replayed into
    /// the book until restoreFromLedger() is called.
    Exchange(const ExchangeConfig& config, std::unique_ptr<Ledger> ledger);
    ~Exchange();

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    /// Non-owning; nullptr disables market updates. Set before traffic starts.
    void setMarketSink(IMarketSink* sink) { sink_.store(sink); }

    /// Rebuild resting orders from OPEN/PARTIAL ledger records, in ledger
    /// order, and resume trade numbering. Returns the number restored.
    size_t restoreFromLedger();

    /// Validate, match and persist one order.
    /// Throws ValidationError (nothing changed) or PersistenceError (book
    /// mutated, ledger not).
    SubmitResult submit(const OrderRequest& request);
    SubmitResult submit(const NewOrder& order);

    /// Remove an active order and record it CANCELED.
    /// Throws NotFoundError for unknown or already canceled ids,
    /// InvalidStateError for filled orders, PersistenceError if the commit fails.
    bool cancel(const OrderId& id);

    BookSnapshot snapshot() const;
    std::vector<std::pair<PriceTicks, Quantity>> depth(Side side) const;
    std::optional<PriceTicks> bestBid() const;
    std::optional<PriceTicks> bestAsk() const;
    size_t restingOrders() const;

    /// Newest first, from the ledger.
    std::vector<Trade> recentTrades(size_t limit) const;
    /// Oldest first, from the ledger.
    std::vector<Trade> tradeHistory() const;
    std::optional<LedgerOrder> order(const OrderId& id) const;

    uint64_t persistenceFailures() const { return persistence_failures_.load(); }
    size_t pendingCycles() const { return gate_.pending(); }

    const ExchangeConfig& config() const { return config_; }
    Ledger& ledger() { return *ledger_; }
    const Ledger& ledger() const { return *ledger_; }

private:
    SubmitResult runSubmitCycle(NewOrder order);
    OrderId generateId();
    BookSnapshot lockedSnapshot() const;
    void publish(uint64_t ts_ns);

    ExchangeConfig config_;
    std::unique_ptr<Ledger> ledger_;
    LedgerReconciler reconciler_;

    mutable std::shared_mutex book_mutex_;
    OrderBook book_;
    PriceTimeMatchingEngine engine_;
    SerializationGate gate_;

    Mt19937Rng rng_;   // used inside the gate only
    std::atomic<IMarketSink*> sink_{nullptr};
    std::atomic<uint64_t> persistence_failures_{0};
};

}  // namespace matchbook
