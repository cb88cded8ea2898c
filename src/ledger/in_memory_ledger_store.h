#pragma once

#include "ledger/i_ledger_store.h"
#include "core/records.h"

#include <cstddef>
#include <vector>

namespace matchbook {

/// Volatile store: keeps committed cycles in a vector. Used when no ledger
/// file is configured, and in tests.
class InMemoryLedgerStore : public ILedgerStore {
public:
    void commit(const LedgerCycle& cycle) override;

    const std::vector<LedgerCycle>& cycles() const { return cycles_; }
    size_t size() const { return cycles_.size(); }
    void clear() { cycles_.clear(); }

private:
    std::vector<LedgerCycle> cycles_;
};

}  // namespace matchbook
