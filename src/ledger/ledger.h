#pragma once

#include "ledger/i_ledger_store.h"
#include "core/records.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace matchbook {

/// The durable record of orders and trades, plus an in-memory projection of
/// everything committed so far.
///
/// commit() writes a cycle to the store first and applies it to the
/// projection only once the store has accepted it, so queries never reflect
/// a cycle that is not durable. Queries take a shared lock and may run
/// concurrently with a commit.
class Ledger {
public:
    explicit Ledger(std::unique_ptr<ILedgerStore> store);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    /// Open (or create) a .mbl file and replay its complete commits.
    static std::unique_ptr<Ledger> openFile(const std::string& path);

    /// Ledger backed by an InMemoryLedgerStore.
    static std::unique_ptr<Ledger> inMemory();

    /// Apply already-durable cycles to the projection without writing them.
    void replay(const std::vector<LedgerCycle>& cycles);

    /// Assign the next cycle number, write the cycle durably, then apply it.
    /// Throws PersistenceError if the store fails; the projection is then
    /// unchanged.
    uint64_t commit(LedgerCycle& cycle);

    std::optional<LedgerOrder> find(const OrderId& id) const;
    bool contains(const OrderId& id) const;

    /// Up to `limit` trades, newest first.
    std::vector<Trade> recentTrades(size_t limit) const;

    /// All trades, oldest first.
    std::vector<Trade> trades() const;

    /// All orders in creation order.
    std::vector<LedgerOrder> orders() const;

    size_t orderCount() const;
    size_t tradeCount() const;
    uint64_t lastTradeSequence() const;
    uint64_t lastCycle() const;

    void close();

    ILedgerStore& store() { return *store_; }

private:
    void apply(const LedgerCycle& cycle);

    mutable std::shared_mutex mutex_;
    std::unique_ptr<ILedgerStore> store_;

    std::vector<LedgerOrder> orders_;
    std::unordered_map<OrderId, size_t> order_index_;
    std::vector<Trade> trades_;
    uint64_t last_trade_sequence_ = 0;
    uint64_t last_cycle_ = 0;
};

}  // namespace matchbook
