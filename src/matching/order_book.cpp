#include "matching/order_book.h"
#include "core/errors.h"

#include <algorithm>

namespace matchbook {

void OrderBook::insert(Order order) {
    if (order.quantity == 0)
        throw InvalidStateError("cannot rest order " + order.id + " with zero quantity");
    if (index_.count(order.id) != 0)
        throw InvalidStateError("order " + order.id + " is already resting");

    order.sequence = next_sequence_++;
    index_[order.id] = {order.side, order.price};
    sideMap(order.side)[order.price].push_back(std::move(order));
}

std::optional<Order> OrderBook::removeById(Side side, const OrderId& id) {
    auto idx = index_.find(id);
    if (idx == index_.end() || idx->second.first != side)
        return std::nullopt;

    Ladder& levels = sideMap(side);
    auto level_it = levels.find(idx->second.second);
    if (level_it == levels.end())
        return std::nullopt;

    Level& queue = level_it->second;
    auto it = std::find_if(queue.begin(), queue.end(),
                           [&id](const Order& o) { return o.id == id; });
    if (it == queue.end())
        return std::nullopt;

    Order removed = std::move(*it);
    queue.erase(it);
    if (queue.empty())
        levels.erase(level_it);
    index_.erase(idx);
    return removed;
}

std::optional<Order> OrderBook::removeById(const OrderId& id) {
    auto idx = index_.find(id);
    if (idx == index_.end())
        return std::nullopt;
    return removeById(idx->second.first, id);
}

const Order* OrderBook::bestOpposing(Side side, PriceTicks limit_price) const {
    if (side == Side::BUY) {
        if (asks_.empty())
            return nullptr;
        auto best = asks_.begin();
        if (best->first > limit_price)
            return nullptr;
        return &best->second.front();
    }

    if (bids_.empty())
        return nullptr;
    auto best = bids_.rbegin();
    if (best->first < limit_price)
        return nullptr;
    return &best->second.front();
}

Quantity OrderBook::fill(Side side, const OrderId& id, Quantity qty) {
    auto idx = index_.find(id);
    if (idx == index_.end() || idx->second.first != side)
        throw InvalidStateError("order " + id + " is not resting");

    Order* order = locate(side, idx->second.second, id);
    if (!order)
        throw InvalidStateError("order index is inconsistent for " + id);
    if (qty > order->quantity)
        throw InvalidStateError("fill of " + std::to_string(qty) + " exceeds remaining " +
                                std::to_string(order->quantity) + " on " + id);

    order->quantity -= qty;
    const Quantity remaining = order->quantity;
    if (remaining == 0)
        removeById(side, id);
    return remaining;
}

const Order* OrderBook::find(const OrderId& id) const {
    auto idx = index_.find(id);
    if (idx == index_.end())
        return nullptr;

    const Ladder& levels = sideMap(idx->second.first);
    auto level_it = levels.find(idx->second.second);
    if (level_it == levels.end())
        return nullptr;
    for (const auto& o : level_it->second) {
        if (o.id == id)
            return &o;
    }
    return nullptr;
}

std::optional<PriceTicks> OrderBook::bestBid() const {
    if (bids_.empty())
        return std::nullopt;
    return bids_.rbegin()->first;
}

std::optional<PriceTicks> OrderBook::bestAsk() const {
    if (asks_.empty())
        return std::nullopt;
    return asks_.begin()->first;
}

static Quantity levelQuantity(const std::deque<Order>& level) {
    Quantity total = 0;
    for (const auto& o : level)
        total += o.quantity;
    return total;
}

std::vector<std::pair<PriceTicks, Quantity>> OrderBook::depth(Side side) const {
    std::vector<std::pair<PriceTicks, Quantity>> levels;
    if (side == Side::BUY) {
        levels.reserve(bids_.size());
        for (auto it = bids_.rbegin(); it != bids_.rend(); ++it)
            levels.emplace_back(it->first, levelQuantity(it->second));
    } else {
        levels.reserve(asks_.size());
        for (const auto& level : asks_)
            levels.emplace_back(level.first, levelQuantity(level.second));
    }
    return levels;
}

BookSnapshot OrderBook::snapshot() const {
    BookSnapshot snap;
    for (auto it = bids_.rbegin(); it != bids_.rend(); ++it)
        snap.buy.insert(snap.buy.end(), it->second.begin(), it->second.end());
    for (const auto& level : asks_)
        snap.sell.insert(snap.sell.end(), level.second.begin(), level.second.end());
    return snap;
}

void OrderBook::clear() {
    bids_.clear();
    asks_.clear();
    index_.clear();
}

Order* OrderBook::locate(Side side, PriceTicks price, const OrderId& id) {
    Ladder& levels = sideMap(side);
    auto level_it = levels.find(price);
    if (level_it == levels.end())
        return nullptr;
    for (auto& o : level_it->second) {
        if (o.id == id)
            return &o;
    }
    return nullptr;
}

}  // namespace matchbook
