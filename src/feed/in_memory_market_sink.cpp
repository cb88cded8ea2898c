#include "feed/in_memory_market_sink.h"

namespace matchbook {

void InMemoryMarketSink::publish(const MarketUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    updates_.push_back(update);
}

std::vector<MarketUpdate> InMemoryMarketSink::updates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_;
}

size_t InMemoryMarketSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_.size();
}

void InMemoryMarketSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    updates_.clear();
}

}  // namespace matchbook
