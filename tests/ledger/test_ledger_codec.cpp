#include <gtest/gtest.h>
#include "ledger/ledger_codec.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace matchbook {
namespace test {

static std::vector<LedgerEntry> mixedEntries() {
    LedgerOrder o;
    o.id = "ord_abc1234";
    o.side = Side::SELL;
    o.price = 123450;
    o.quantity = 3;
    o.original_quantity = 10;
    o.status = OrderStatus::PARTIAL;
    o.user_id = "trader-7";
    o.created_ns = 11;
    o.updated_ns = 22;

    Trade t;
    t.sequence = 42;
    t.buy_order_id = "b1";
    t.sell_order_id = o.id;
    t.price = 123450;
    t.quantity = 7;
    t.ts_ns = 22;

    OrderUpdate u;
    u.id = "b1";
    u.quantity = 0;
    u.status = OrderStatus::FILLED;
    u.ts_ns = 22;

    return {makePutEntry(o), makeTradeEntry(t), makeUpdateEntry(u)};
}

TEST(LedgerCodecTest, DecodesWhatWasEncoded) {
    const auto entries = mixedEntries();
    const auto bytes = encodePayload(entries);
    const auto decoded = decodePayload(bytes.data(), bytes.size(), 3);

    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[0].order.id, "ord_abc1234");
    EXPECT_EQ(decoded[0].order.side, Side::SELL);
    EXPECT_EQ(decoded[0].order.price, 123450);
    EXPECT_EQ(decoded[0].order.quantity, 3u);
    EXPECT_EQ(decoded[0].order.original_quantity, 10u);
    EXPECT_EQ(decoded[0].order.status, OrderStatus::PARTIAL);
    EXPECT_EQ(decoded[0].order.user_id, "trader-7");
    EXPECT_EQ(decoded[0].order.updated_ns, 22u);
    EXPECT_EQ(decoded[1].trade.sequence, 42u);
    EXPECT_EQ(decoded[1].trade.sell_order_id, "ord_abc1234");
    EXPECT_EQ(decoded[1].trade.quantity, 7u);
    EXPECT_EQ(decoded[2].update.id, "b1");
    EXPECT_EQ(decoded[2].update.status, OrderStatus::FILLED);
}

TEST(LedgerCodecTest, EmptyPayload) {
    const auto bytes = encodePayload({});
    EXPECT_TRUE(bytes.empty());
    EXPECT_TRUE(decodePayload(bytes.data(), 0, 0).empty());
}

TEST(LedgerCodecTest, LittleEndianLayout) {
    OrderUpdate u;
    u.id = "x";
    u.quantity = 0x0102;
    u.status = OrderStatus::PARTIAL;
    const auto bytes = encodePayload({makeUpdateEntry(u)});

    // tag, u16 length, id, u64 quantity, status, u64 ts
    ASSERT_EQ(bytes.size(), 1u + 2u + 1u + 8u + 1u + 8u);
    EXPECT_EQ(bytes[0], static_cast<char>(LedgerRecordType::ORDER_UPDATE));
    EXPECT_EQ(bytes[1], 1);
    EXPECT_EQ(bytes[2], 0);
    EXPECT_EQ(bytes[3], 'x');
    EXPECT_EQ(bytes[4], 0x02);
    EXPECT_EQ(bytes[5], 0x01);
}

TEST(LedgerCodecTest, TruncatedPayloadThrows) {
    const auto bytes = encodePayload(mixedEntries());
    EXPECT_THROW(decodePayload(bytes.data(), bytes.size() - 1, 3), std::runtime_error);
}

TEST(LedgerCodecTest, RecordCountMismatchThrows) {
    const auto bytes = encodePayload(mixedEntries());
    EXPECT_THROW(decodePayload(bytes.data(), bytes.size(), 2), std::runtime_error);
    EXPECT_THROW(decodePayload(bytes.data(), bytes.size(), 4), std::runtime_error);
}

TEST(LedgerCodecTest, UnknownTagThrows) {
    auto bytes = encodePayload(mixedEntries());
    bytes[0] = 9;
    EXPECT_THROW(decodePayload(bytes.data(), bytes.size(), 3), std::runtime_error);
}

TEST(LedgerCodecTest, BadStatusThrows) {
    OrderUpdate u;
    u.id = "x";
    auto bytes = encodePayload({makeUpdateEntry(u)});
    bytes[1 + 2 + 1 + 8] = 17;
    EXPECT_THROW(decodePayload(bytes.data(), bytes.size(), 1), std::runtime_error);
}

TEST(LedgerCodecTest, OversizeStringRejected) {
    LedgerOrder o;
    o.id = std::string(70000, 'a');
    EXPECT_THROW(encodePayload({makePutEntry(o)}), std::runtime_error);
}

}  // namespace test
}  // namespace matchbook
