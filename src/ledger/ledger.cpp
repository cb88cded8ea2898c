#include "ledger/ledger.h"
#include "ledger/binary_ledger_store.h"
#include "ledger/in_memory_ledger_store.h"
#include "ledger/ledger_format.h"
#include "ledger/ledger_reader.h"
#include "core/errors.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace matchbook {

Ledger::Ledger(std::unique_ptr<ILedgerStore> store) : store_(std::move(store)) {
    if (!store_)
        throw std::invalid_argument("Ledger: store must not be null");
}

std::unique_ptr<Ledger> Ledger::openFile(const std::string& path) {
    std::vector<LedgerCycle> recovered;
    std::error_code ec;
    const std::uintmax_t size =
        std::filesystem::exists(path, ec) ? std::filesystem::file_size(path, ec) : 0;
    if (!ec && size >= sizeof(LedgerFileHeader)) {
        LedgerReader reader(path);
        recovered = reader.cycles();
        std::printf("[ledger] %s: %u commits, %llu records recovered\n",
                    path.c_str(), reader.commitCount(),
                    static_cast<unsigned long long>(reader.totalRecords()));
    }

    // The store trims any torn tail the reader stopped at.
    auto ledger = std::make_unique<Ledger>(std::make_unique<BinaryLedgerStore>(path));
    ledger->replay(recovered);
    return ledger;
}

std::unique_ptr<Ledger> Ledger::inMemory() {
    return std::make_unique<Ledger>(std::make_unique<InMemoryLedgerStore>());
}

void Ledger::replay(const std::vector<LedgerCycle>& cycles) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& cycle : cycles) {
        apply(cycle);
        last_cycle_ = std::max(last_cycle_, cycle.cycle);
    }
}

uint64_t Ledger::commit(LedgerCycle& cycle) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        cycle.cycle = last_cycle_ + 1;
    }

    try {
        store_->commit(cycle);
    } catch (const std::exception& e) {
        throw PersistenceError(cycle.cycle, e.what());
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    apply(cycle);
    last_cycle_ = cycle.cycle;
    return cycle.cycle;
}

std::optional<LedgerOrder> Ledger::find(const OrderId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = order_index_.find(id);
    if (it == order_index_.end())
        return std::nullopt;
    return orders_[it->second];
}

bool Ledger::contains(const OrderId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_index_.count(id) != 0;
}

std::vector<Trade> Ledger::recentTrades(size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const size_t n = std::min(limit, trades_.size());
    return std::vector<Trade>(trades_.rbegin(), trades_.rbegin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<Trade> Ledger::trades() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_;
}

std::vector<LedgerOrder> Ledger::orders() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return orders_;
}

size_t Ledger::orderCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return orders_.size();
}

size_t Ledger::tradeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_.size();
}

uint64_t Ledger::lastTradeSequence() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_trade_sequence_;
}

uint64_t Ledger::lastCycle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_cycle_;
}

void Ledger::close() {
    store_->close();
}

// Caller holds the exclusive lock.
void Ledger::apply(const LedgerCycle& cycle) {
    for (const auto& e : cycle.entries) {
        switch (e.type) {
            case LedgerRecordType::ORDER_PUT: {
                auto it = order_index_.find(e.order.id);
                if (it == order_index_.end()) {
                    order_index_[e.order.id] = orders_.size();
                    orders_.push_back(e.order);
                } else {
                    orders_[it->second] = e.order;
                }
                break;
            }
            case LedgerRecordType::ORDER_UPDATE: {
                auto it = order_index_.find(e.update.id);
                if (it == order_index_.end()) {
                    std::fprintf(stderr, "[ledger] cycle %llu: update for unknown order %s ignored\n",
                                 static_cast<unsigned long long>(cycle.cycle), e.update.id.c_str());
                    break;
                }
                LedgerOrder& o = orders_[it->second];
                o.quantity   = e.update.quantity;
                o.status     = e.update.status;
                o.updated_ns = e.update.ts_ns;
                break;
            }
            case LedgerRecordType::TRADE:
                trades_.push_back(e.trade);
                last_trade_sequence_ = std::max(last_trade_sequence_, e.trade.sequence);
                break;
        }
    }
}

}  // namespace matchbook
