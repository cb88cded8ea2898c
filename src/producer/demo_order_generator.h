#pragma once

#include "engine/order_request.h"
#include "rng/irng.h"
#include "core/records.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace matchbook {

struct DemoOrderParams {
    double   default_midpoint       = 10.0;  // used before any trade exists
    size_t   midpoint_trades        = 20;
    double   jitter_min             = 0.02;  // fraction of midpoint
    double   jitter_max             = 0.04;
    double   spike_probability      = 0.10;
    double   spike_jitter           = 0.08;
    double   marketable_probability = 0.70;
    uint32_t min_quantity           = 1;
    uint32_t max_quantity           = 8;
};

/// Synthetic order flow around the recent trade price.
///
/// Price: midpoint plus a symmetric jitter, occasionally a wider spike, then
/// with marketable_probability pulled across the spread so it trades.
/// Rounded to cents, never below 0.01.
class DemoOrderGenerator {
public:
    explicit DemoOrderGenerator(IRng& rng, const DemoOrderParams& params = DemoOrderParams{});

    /// `recent_trades` newest first.
    NewOrder generate(const std::vector<Trade>& recent_trades,
                      std::optional<PriceTicks> best_bid,
                      std::optional<PriceTicks> best_ask);

    /// Mean price of the newest `params.midpoint_trades` trades, in currency
    /// units; default_midpoint when there are none.
    double midpoint(const std::vector<Trade>& recent_trades) const;

    const DemoOrderParams& params() const { return params_; }

private:
    IRng& rng_;
    DemoOrderParams params_;
};

}  // namespace matchbook
