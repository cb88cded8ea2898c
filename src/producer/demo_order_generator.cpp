#include "producer/demo_order_generator.h"
#include "core/price.h"
#include "rng/random_id.h"

#include <algorithm>
#include <cmath>

namespace matchbook {

static constexpr PriceTicks kMinDemoPrice = kPriceScale / 100;   // 0.01

DemoOrderGenerator::DemoOrderGenerator(IRng& rng, const DemoOrderParams& params)
    : rng_(rng), params_(params) {}

double DemoOrderGenerator::midpoint(const std::vector<Trade>& recent_trades) const {
    const size_t n = std::min(params_.midpoint_trades, recent_trades.size());
    if (n == 0)
        return params_.default_midpoint;

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i)
        sum += static_cast<double>(recent_trades[i].price) / kPriceScale;
    return sum / static_cast<double>(n);
}

NewOrder DemoOrderGenerator::generate(const std::vector<Trade>& recent_trades,
                                      std::optional<PriceTicks> best_bid,
                                      std::optional<PriceTicks> best_ask) {
    const double mid = midpoint(recent_trades);

    NewOrder order;
    order.side = rng_.uniform() > 0.5 ? Side::BUY : Side::SELL;

    const bool spike = rng_.uniform() < params_.spike_probability;
    const double range = spike
        ? params_.spike_jitter
        : params_.jitter_min + rng_.uniform() * (params_.jitter_max - params_.jitter_min);
    const double jitter = (rng_.uniform() - 0.5) * 2.0 * range * mid;

    PriceTicks price = std::max(kMinDemoPrice,
                                static_cast<PriceTicks>(std::llround((mid + jitter) * kPriceScale)));

    if (rng_.uniform() < params_.marketable_probability) {
        if (order.side == Side::BUY && best_ask)
            price = std::max(price, *best_ask);
        else if (order.side == Side::SELL && best_bid)
            price = std::min(price, *best_bid);
    }

    order.price    = std::max(kMinDemoPrice, roundToCents(price));
    order.quantity = rng_.uniformInt(params_.min_quantity, params_.max_quantity);
    order.id       = randomId(rng_, "demo_");
    return order;
}

}  // namespace matchbook
