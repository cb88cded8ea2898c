#pragma once

#include "engine/exchange.h"
#include "producer/demo_order_generator.h"
#include "rng/mt19937_rng.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace matchbook {

struct DemoConfig {
    uint32_t min_interval_ms   = 2000;
    uint32_t max_interval_ms   = 4000;
    double   burst_probability = 0.15;
    uint32_t burst_min_orders  = 3;
    uint32_t burst_max_orders  = 5;
    uint32_t burst_min_gap_ms  = 150;
    uint32_t burst_max_gap_ms  = 300;
    uint32_t burst_cooldown_ms = 30000;   // at most one burst per cooldown
    uint64_t seed              = 0;       // 0 = seed from the clock
    DemoOrderParams order;
};

/// Background thread feeding synthetic orders into an Exchange, as an
/// ordinary caller of submit(). One order every min..max interval, with
/// occasional rate-limited bursts. A failed tick is logged and the loop
/// carries on.
class DemoMarket {
public:
    explicit DemoMarket(Exchange& exchange, const DemoConfig& config = DemoConfig{});
    ~DemoMarket();

    DemoMarket(const DemoMarket&) = delete;
    DemoMarket& operator=(const DemoMarket&) = delete;

    /// No-op if already running.
    void start();
    /// Interrupts any pending wait and joins the thread. No-op if stopped.
    void stop();
    bool isRunning() const { return running_.load(); }

    /// Generate and submit one order. Returns false (after logging) if the
    /// exchange rejected it.
    bool tick();

    uint64_t ordersSubmitted() const { return orders_submitted_.load(); }
    uint64_t tickErrors() const { return tick_errors_.load(); }

private:
    void run();
    void maybeBurst();
    uint32_t sampleBetween(uint32_t lo, uint32_t hi);
    /// Returns false if stop() was requested during the wait.
    bool waitFor(uint32_t ms);

    Exchange& exchange_;
    DemoConfig config_;

    std::mutex rng_mutex_;   // rng_ and generator_ are shared by tick() callers
    Mt19937Rng rng_;
    DemoOrderGenerator generator_;

    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};

    bool burst_seen_ = false;
    std::chrono::steady_clock::time_point last_burst_;

    std::atomic<uint64_t> orders_submitted_{0};
    std::atomic<uint64_t> tick_errors_{0};
};

}  // namespace matchbook
