#include "engine/exchange.h"
#include "core/errors.h"
#include "rng/random_id.h"

#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace matchbook {

namespace {

Ledger& requireLedger(const std::unique_ptr<Ledger>& ledger) {
    if (!ledger)
        throw std::invalid_argument("Exchange: ledger must not be null");
    return *ledger;
}

}  // namespace

Exchange::Exchange(const ExchangeConfig& config, std::unique_ptr<Ledger> ledger)
    : config_(config),
      ledger_(std::move(ledger)),
      reconciler_(requireLedger(ledger_)),
      rng_(config.seed != 0 ? config.seed : wallClockNs())
{
    engine_.setNextTradeSequence(ledger_->lastTradeSequence() + 1);
}

Exchange::~Exchange() = default;

size_t Exchange::restoreFromLedger() {
    return gate_.runExclusive([this] {
        std::unique_lock<std::shared_mutex> lock(book_mutex_);
        book_.clear();

        size_t restored = 0;
        for (const auto& rec : ledger_->orders()) {
            if (rec.status != OrderStatus::OPEN && rec.status != OrderStatus::PARTIAL)
                continue;
            if (rec.quantity == 0)
                continue;

            Order o;
            o.id                = rec.id;
            o.side              = rec.side;
            o.price             = rec.price;
            o.quantity          = rec.quantity;
            o.original_quantity = rec.original_quantity;
            o.user_id           = rec.user_id;
            book_.insert(std::move(o));
            ++restored;
        }

        engine_.setNextTradeSequence(ledger_->lastTradeSequence() + 1);
        return restored;
    });
}

SubmitResult Exchange::submit(const OrderRequest& request) {
    return runSubmitCycle(validateOrderRequest(request));
}

SubmitResult Exchange::submit(const NewOrder& order) {
    validateNewOrder(order);
    return runSubmitCycle(order);
}

SubmitResult Exchange::runSubmitCycle(NewOrder req) {
    return gate_.runExclusive([this, &req] {
        if (req.id.empty()) {
            req.id = generateId();
        } else if (book_.contains(req.id) || ledger_->contains(req.id)) {
            throw ValidationError("duplicate order id '" + req.id + "'");
        }

        Order incoming;
        incoming.id                = req.id;
        incoming.side              = req.side;
        incoming.price             = req.price;
        incoming.quantity          = req.quantity;
        incoming.original_quantity = req.quantity;
        incoming.user_id           = req.user_id;

        const uint64_t ts = wallClockNs();
        MatchResult match;
        {
            std::unique_lock<std::shared_mutex> lock(book_mutex_);
            match = engine_.match(incoming, book_, ts);
        }

        // Only this cycle writes the book, so reading it here without the
        // lock is safe.
        SubmitResult result;
        try {
            result.order = reconciler_.reconcileSubmission(incoming, match.trades, book_, ts);
        } catch (const PersistenceError& e) {
            ++persistence_failures_;
            std::fprintf(stderr, "[match] %s (order %s, %zu trades not recorded)\n",
                         e.what(), incoming.id.c_str(), match.trades.size());
            throw;
        }

        result.trades = std::move(match.trades);
        result.book = lockedSnapshot();
        publish(ts);
        return result;
    });
}

bool Exchange::cancel(const OrderId& id) {
    if (id.empty())
        throw ValidationError("order id is required");

    return gate_.runExclusive([this, &id] {
        const auto existing = ledger_->find(id);
        if (!existing || existing->status == OrderStatus::CANCELED)
            throw NotFoundError("order '" + id + "' not found");
        if (existing->status == OrderStatus::FILLED)
            throw InvalidStateError("order '" + id + "' is already filled");

        const uint64_t ts = wallClockNs();
        {
            std::unique_lock<std::shared_mutex> lock(book_mutex_);
            book_.removeById(existing->side, id);
        }

        try {
            reconciler_.reconcileCancel(*existing, ts);
        } catch (const PersistenceError& e) {
            ++persistence_failures_;
            std::fprintf(stderr, "[match] %s (cancel of %s)\n", e.what(), id.c_str());
            throw;
        }

        publish(ts);
        return true;
    });
}

BookSnapshot Exchange::snapshot() const {
    return lockedSnapshot();
}

std::vector<std::pair<PriceTicks, Quantity>> Exchange::depth(Side side) const {
    std::shared_lock<std::shared_mutex> lock(book_mutex_);
    return book_.depth(side);
}

std::optional<PriceTicks> Exchange::bestBid() const {
    std::shared_lock<std::shared_mutex> lock(book_mutex_);
    return book_.bestBid();
}

std::optional<PriceTicks> Exchange::bestAsk() const {
    std::shared_lock<std::shared_mutex> lock(book_mutex_);
    return book_.bestAsk();
}

size_t Exchange::restingOrders() const {
    std::shared_lock<std::shared_mutex> lock(book_mutex_);
    return book_.orderCount();
}

std::vector<Trade> Exchange::recentTrades(size_t limit) const {
    return ledger_->recentTrades(limit);
}

std::vector<Trade> Exchange::tradeHistory() const {
    return ledger_->trades();
}

std::optional<LedgerOrder> Exchange::order(const OrderId& id) const {
    return ledger_->find(id);
}

// --- Private ---

OrderId Exchange::generateId() {
    OrderId id;
    do {
        id = randomId(rng_, "ord_");
    } while (book_.contains(id) || ledger_->contains(id));
    return id;
}

BookSnapshot Exchange::lockedSnapshot() const {
    std::shared_lock<std::shared_mutex> lock(book_mutex_);
    return book_.snapshot();
}

void Exchange::publish(uint64_t ts_ns) {
    IMarketSink* sink = sink_.load();
    if (!sink)
        return;

    try {
        MarketUpdate update;
        update.ts_ns  = ts_ns;
        update.book   = lockedSnapshot();
        update.trades = ledger_->recentTrades(config_.recent_trades);
        sink->publish(update);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[feed] market update dropped: %s\n", e.what());
    }
}

}  // namespace matchbook
