#include "producer/demo_market.h"
#include "core/price.h"

#include <cstdio>
#include <exception>

namespace matchbook {

DemoMarket::DemoMarket(Exchange& exchange, const DemoConfig& config)
    : exchange_(exchange),
      config_(config),
      rng_(config.seed != 0 ? config.seed : wallClockNs()),
      generator_(rng_, config.order) {}

DemoMarket::~DemoMarket() {
    stop();
}

void DemoMarket::start() {
    if (running_.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = false;
    }
    burst_seen_ = false;
    thread_ = std::thread(&DemoMarket::run, this);
    std::printf("[demo] demo market started\n");
}

void DemoMarket::stop() {
    if (!running_.load() && !thread_.joinable())
        return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    running_.store(false);
    std::printf("[demo] demo market stopped (%llu orders, %llu errors)\n",
                static_cast<unsigned long long>(orders_submitted_.load()),
                static_cast<unsigned long long>(tick_errors_.load()));
}

bool DemoMarket::tick() {
    NewOrder order;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        order = generator_.generate(exchange_.recentTrades(config_.order.midpoint_trades),
                                    exchange_.bestBid(), exchange_.bestAsk());
    }

    try {
        const SubmitResult result = exchange_.submit(order);
        ++orders_submitted_;
        std::printf("[demo] %s %llu @ %s -> %s, %zu trades\n",
                    sideName(order.side),
                    static_cast<unsigned long long>(order.quantity),
                    formatPrice(order.price).c_str(),
                    statusName(result.order.status),
                    result.trades.size());
        return true;
    } catch (const std::exception& e) {
        ++tick_errors_;
        std::fprintf(stderr, "[demo] tick failed: %s\n", e.what());
        return false;
    }
}

// --- Private ---

void DemoMarket::run() {
    tick();
    while (true) {
        maybeBurst();
        if (!waitFor(sampleBetween(config_.min_interval_ms, config_.max_interval_ms)))
            break;
        tick();
    }
}

void DemoMarket::maybeBurst() {
    double roll;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        roll = rng_.uniform();
    }
    if (roll >= config_.burst_probability)
        return;

    const auto now = std::chrono::steady_clock::now();
    if (burst_seen_ && now - last_burst_ < std::chrono::milliseconds(config_.burst_cooldown_ms))
        return;
    burst_seen_ = true;
    last_burst_ = now;

    const uint32_t count = sampleBetween(config_.burst_min_orders, config_.burst_max_orders);
    for (uint32_t i = 0; i < count; ++i) {
        tick();
        if (i + 1 < count &&
            !waitFor(sampleBetween(config_.burst_min_gap_ms, config_.burst_max_gap_ms)))
            return;
    }
}

uint32_t DemoMarket::sampleBetween(uint32_t lo, uint32_t hi) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return static_cast<uint32_t>(rng_.uniformInt(lo, hi));
}

bool DemoMarket::waitFor(uint32_t ms) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, std::chrono::milliseconds(ms),
                              [this] { return stop_requested_; });
}

}  // namespace matchbook
