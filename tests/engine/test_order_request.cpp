#include <gtest/gtest.h>
#include "engine/order_request.h"
#include "core/errors.h"

#include <string>

namespace matchbook {
namespace test {

static OrderRequest request(const std::string& side, const std::string& price,
                            const std::string& quantity, const std::string& id = "") {
    OrderRequest r;
    r.side = side;
    r.price = price;
    r.quantity = quantity;
    r.id = id;
    return r;
}

TEST(OrderRequestTest, ValidBuy) {
    const auto o = validateOrderRequest(request("buy", "9.50", "6", "b1"));
    EXPECT_EQ(o.side, Side::BUY);
    EXPECT_EQ(o.price, 95000);
    EXPECT_EQ(o.quantity, 6u);
    EXPECT_EQ(o.id, "b1");
}

TEST(OrderRequestTest, ValidSellWithoutId) {
    const auto o = validateOrderRequest(request("sell", "10", "1"));
    EXPECT_EQ(o.side, Side::SELL);
    EXPECT_EQ(o.price, 100000);
    EXPECT_TRUE(o.id.empty());
}

TEST(OrderRequestTest, QuantityWithZeroFractionAccepted) {
    EXPECT_EQ(validateOrderRequest(request("buy", "1", "10.0")).quantity, 10u);
    EXPECT_EQ(validateOrderRequest(request("buy", "1", "10.000")).quantity, 10u);
}

TEST(OrderRequestTest, MissingFieldsRejected) {
    EXPECT_THROW(validateOrderRequest(request("", "1", "1")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "", "1")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "")), ValidationError);
}

TEST(OrderRequestTest, BadSideRejected) {
    EXPECT_THROW(validateOrderRequest(request("BUY", "1", "1")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("hold", "1", "1")), ValidationError);
}

TEST(OrderRequestTest, BadPriceRejected) {
    EXPECT_THROW(validateOrderRequest(request("buy", "0", "1")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "-1", "1")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "abc", "1")), ValidationError);
}

TEST(OrderRequestTest, BadQuantityRejected) {
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "0")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "-3")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "2.5")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "5.")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", ".5")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "1e3")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "99999999999999999999999")),
                 ValidationError);
}

TEST(OrderRequestTest, QuantityCappedAtVenueMaximum) {
    const std::string max_text = std::to_string(kMaxQuantity);
    EXPECT_EQ(validateOrderRequest(request("buy", "1", max_text)).quantity, kMaxQuantity);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", std::to_string(kMaxQuantity + 1))),
                 ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "18446744073709551615")),
                 ValidationError);
}

TEST(OrderRequestTest, MalformedIdRejected) {
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "1", "has space")), ValidationError);
    EXPECT_THROW(validateOrderRequest(request("buy", "1", "1", std::string(65, 'a'))),
                 ValidationError);

    OrderRequest r = request("buy", "1", "1");
    r.user_id = std::string(65, 'u');
    EXPECT_THROW(validateOrderRequest(r), ValidationError);
}

TEST(OrderRequestTest, IsValidOrderId) {
    EXPECT_TRUE(isValidOrderId("ord_abc1234"));
    EXPECT_TRUE(isValidOrderId(std::string(64, 'x')));
    EXPECT_FALSE(isValidOrderId(""));
    EXPECT_FALSE(isValidOrderId("tab\tid"));
    EXPECT_FALSE(isValidOrderId("caf\xc3\xa9"));
}

TEST(OrderRequestTest, ValidateNewOrder) {
    NewOrder o;
    o.side = Side::SELL;
    o.price = 100;
    o.quantity = 1;
    EXPECT_NO_THROW(validateNewOrder(o));

    o.price = 0;
    EXPECT_THROW(validateNewOrder(o), ValidationError);
    o.price = 100;
    o.quantity = 0;
    EXPECT_THROW(validateNewOrder(o), ValidationError);
    o.quantity = kMaxQuantity + 1;
    EXPECT_THROW(validateNewOrder(o), ValidationError);
    o.quantity = kMaxQuantity;
    EXPECT_NO_THROW(validateNewOrder(o));
}

}  // namespace test
}  // namespace matchbook
