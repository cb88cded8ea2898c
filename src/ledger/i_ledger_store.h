#pragma once

#include "core/records.h"

namespace matchbook {

/// Durable backing of the ledger.
/// Implementations: BinaryLedgerStore, InMemoryLedgerStore.
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /// Make every entry of `cycle` durable, or none of them. Throws
    /// std::runtime_error on failure, after undoing any partial write.
    virtual void commit(const LedgerCycle& cycle) = 0;

    virtual void close() {}
};

}  // namespace matchbook
