#include "ledger/in_memory_ledger_store.h"

namespace matchbook {

void InMemoryLedgerStore::commit(const LedgerCycle& cycle) {
    cycles_.push_back(cycle);
}

}  // namespace matchbook
