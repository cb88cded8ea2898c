#include <gtest/gtest.h>
#include "engine/exchange.h"
#include "ledger/ledger.h"
#include "core/errors.h"

#include <cstdio>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace matchbook {
namespace test {

// Book and ledger must describe the same resting orders, and no order may
// trade more than it was submitted with.
static void expectConsistent(const Exchange& exchange) {
    const auto book = exchange.snapshot();

    if (!book.buy.empty() && !book.sell.empty()) {
        EXPECT_LT(book.buy.front().price, book.sell.front().price) << "crossed book";
    }
    for (size_t i = 1; i < book.buy.size(); ++i)
        EXPECT_GE(book.buy[i - 1].price, book.buy[i].price);
    for (size_t i = 1; i < book.sell.size(); ++i)
        EXPECT_LE(book.sell[i - 1].price, book.sell[i].price);

    size_t resting = 0;
    for (const auto* side : {&book.buy, &book.sell}) {
        for (const auto& o : *side) {
            ++resting;
            EXPECT_GT(o.quantity, 0u);
            const auto rec = exchange.order(o.id);
            ASSERT_TRUE(rec.has_value()) << o.id;
            EXPECT_EQ(rec->quantity, o.quantity) << o.id;
            EXPECT_EQ(rec->status, deriveStatus(rec->original_quantity, rec->quantity, false));
        }
    }

    std::map<OrderId, Quantity> traded;
    for (const auto& t : exchange.tradeHistory()) {
        EXPECT_GT(t.quantity, 0u);
        traded[t.buy_order_id] += t.quantity;
        traded[t.sell_order_id] += t.quantity;
    }

    size_t active = 0;
    for (const auto& rec : exchange.ledger().orders()) {
        EXPECT_LE(traded[rec.id], rec.original_quantity) << rec.id;
        if (rec.status == OrderStatus::OPEN || rec.status == OrderStatus::PARTIAL) {
            ++active;
            EXPECT_GT(rec.quantity, 0u);
        } else {
            EXPECT_EQ(rec.quantity, 0u) << rec.id;
        }
        if (rec.status != OrderStatus::CANCELED) {
            EXPECT_EQ(rec.original_quantity - traded[rec.id], rec.quantity) << rec.id;
        }
    }
    EXPECT_EQ(active, resting);
    EXPECT_EQ(exchange.restingOrders(), resting);
}

class BookInvariantsTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = testing::TempDir() + "test_book_invariants_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".mbl";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    // Random limit orders around 100.00, with occasional cancels of
    // earlier ids (some of which are filled or already canceled).
    static void drive(Exchange& exchange, uint64_t seed, int steps, std::vector<OrderId>& ids) {
        std::mt19937_64 rng(seed);
        for (int i = 0; i < steps; ++i) {
            if (!ids.empty() && rng() % 5 == 0) {
                const OrderId& id = ids[rng() % ids.size()];
                try {
                    exchange.cancel(id);
                } catch (const NotFoundError&) {
                    // already canceled
                } catch (const InvalidStateError&) {
                    // already filled
                }
                continue;
            }
            NewOrder o;
            o.side = (rng() & 1) ? Side::BUY : Side::SELL;
            o.price = 995000 + static_cast<PriceTicks>(rng() % 11) * 1000;
            o.quantity = 1 + rng() % 20;
            ids.push_back(exchange.submit(o).order.id);
        }
    }

    std::string path_;
};

TEST_F(BookInvariantsTest, RandomFlowInMemory) {
    ExchangeConfig cfg;
    cfg.seed = 31;
    Exchange exchange(cfg, Ledger::inMemory());
    std::vector<OrderId> ids;

    for (int round = 0; round < 10; ++round) {
        drive(exchange, 1000 + round, 100, ids);
        expectConsistent(exchange);
    }
    EXPECT_GT(exchange.tradeHistory().size(), 0u);
}

TEST_F(BookInvariantsTest, RestartFromLedgerFile) {
    std::vector<OrderId> ids;
    BookSnapshot before;
    size_t trades_before = 0;
    uint64_t last_seq = 0;
    {
        ExchangeConfig cfg;
        cfg.seed = 8;
        Exchange exchange(cfg, Ledger::openFile(path_));
        drive(exchange, 77, 300, ids);
        expectConsistent(exchange);
        before = exchange.snapshot();
        trades_before = exchange.tradeHistory().size();
        last_seq = exchange.ledger().lastTradeSequence();
        exchange.ledger().close();
    }

    ExchangeConfig cfg;
    cfg.seed = 9;
    Exchange exchange(cfg, Ledger::openFile(path_));
    exchange.restoreFromLedger();
    expectConsistent(exchange);

    const auto after = exchange.snapshot();
    ASSERT_EQ(after.buy.size(), before.buy.size());
    ASSERT_EQ(after.sell.size(), before.sell.size());
    for (size_t i = 0; i < before.buy.size(); ++i) {
        EXPECT_EQ(after.buy[i].id, before.buy[i].id);
        EXPECT_EQ(after.buy[i].quantity, before.buy[i].quantity);
    }
    for (size_t i = 0; i < before.sell.size(); ++i) {
        EXPECT_EQ(after.sell[i].id, before.sell[i].id);
        EXPECT_EQ(after.sell[i].quantity, before.sell[i].quantity);
    }
    EXPECT_EQ(exchange.tradeHistory().size(), trades_before);

    drive(exchange, 78, 200, ids);
    expectConsistent(exchange);

    const auto history = exchange.tradeHistory();
    if (history.size() > trades_before) {
        EXPECT_EQ(history[trades_before].sequence, last_seq + 1);
    }
}

}  // namespace test
}  // namespace matchbook
