#include "engine/order_request.h"
#include "core/errors.h"
#include "core/price.h"

#include <limits>

namespace matchbook {

namespace {

// Positive integer, optionally written with an all-zero fraction ("10.0").
Quantity parseQuantity(const std::string& text) {
    if (text.empty())
        throw ValidationError("quantity must be a positive integer");

    Quantity value = 0;
    size_t i = 0;
    for (; i < text.size() && text[i] != '.'; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9')
            throw ValidationError("quantity must be a positive integer, got '" + text + "'");
        const Quantity digit = static_cast<Quantity>(c - '0');
        if (value > (std::numeric_limits<Quantity>::max() - digit) / 10)
            throw ValidationError("quantity out of range: '" + text + "'");
        value = value * 10 + digit;
    }
    if (i == 0)
        throw ValidationError("quantity must be a positive integer, got '" + text + "'");
    if (i < text.size()) {
        if (i + 1 == text.size())
            throw ValidationError("quantity must be a positive integer, got '" + text + "'");
        for (size_t j = i + 1; j < text.size(); ++j) {
            if (text[j] != '0')
                throw ValidationError("quantity must be a positive integer, got '" + text + "'");
        }
    }
    if (value == 0)
        throw ValidationError("quantity must be a positive integer, got '" + text + "'");
    if (value > kMaxQuantity)
        throw ValidationError("quantity out of range: '" + text + "'");
    return value;
}

}  // namespace

bool isValidOrderId(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLength)
        return false;
    for (char c : id) {
        if (c <= ' ' || c > '~')
            return false;
    }
    return true;
}

NewOrder validateOrderRequest(const OrderRequest& req) {
    if (req.side.empty() || req.price.empty() || req.quantity.empty())
        throw ValidationError("missing fields: side, price and quantity are required");

    NewOrder order;
    if (req.side == "buy")
        order.side = Side::BUY;
    else if (req.side == "sell")
        order.side = Side::SELL;
    else
        throw ValidationError("side must be 'buy' or 'sell', got '" + req.side + "'");

    order.price    = parsePrice(req.price);
    order.quantity = parseQuantity(req.quantity);
    order.id       = req.id;
    order.user_id  = req.user_id;

    if (!order.id.empty() && !isValidOrderId(order.id))
        throw ValidationError("malformed order id '" + order.id + "'");
    if (order.user_id.size() > kMaxIdLength)
        throw ValidationError("user id longer than " + std::to_string(kMaxIdLength) + " characters");
    return order;
}

void validateNewOrder(const NewOrder& order) {
    if (order.price <= 0)
        throw ValidationError("price must be > 0");
    if (order.quantity == 0)
        throw ValidationError("quantity must be a positive integer");
    if (order.quantity > kMaxQuantity)
        throw ValidationError("quantity out of range: " + std::to_string(order.quantity));
    if (!order.id.empty() && !isValidOrderId(order.id))
        throw ValidationError("malformed order id '" + order.id + "'");
    if (order.user_id.size() > kMaxIdLength)
        throw ValidationError("user id longer than " + std::to_string(kMaxIdLength) + " characters");
}

}  // namespace matchbook
