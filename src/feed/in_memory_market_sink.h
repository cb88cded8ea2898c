#pragma once

#include "feed/i_market_sink.h"
#include "core/records.h"

#include <cstddef>
#include <mutex>
#include <vector>

namespace matchbook {

/// Keeps every published update; used by tests and the interactive runner.
class InMemoryMarketSink : public IMarketSink {
public:
    void publish(const MarketUpdate& update) override;

    std::vector<MarketUpdate> updates() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<MarketUpdate> updates_;
};

}  // namespace matchbook
