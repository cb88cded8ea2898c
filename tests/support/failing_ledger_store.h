#pragma once

#include "ledger/i_ledger_store.h"
#include "core/records.h"

#include <atomic>
#include <stdexcept>
#include <vector>

namespace matchbook {
namespace test {

/// In-memory store whose commits can be made to fail on demand.
class FailingLedgerStore : public ILedgerStore {
public:
    void commit(const LedgerCycle& cycle) override {
        ++attempts_;
        if (fail_.load())
            throw std::runtime_error("simulated disk failure");
        cycles_.push_back(cycle);
    }

    void setFailing(bool fail) { fail_.store(fail); }

    const std::vector<LedgerCycle>& cycles() const { return cycles_; }
    int attempts() const { return attempts_; }

private:
    std::atomic<bool> fail_{false};
    std::vector<LedgerCycle> cycles_;
    int attempts_ = 0;
};

}  // namespace test
}  // namespace matchbook
