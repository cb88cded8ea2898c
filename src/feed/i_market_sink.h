#pragma once

#include "core/records.h"

namespace matchbook {

/// Abstract market-data output: receives one MarketUpdate per successful
/// match or cancel cycle.
/// Implementations: InMemoryMarketSink, UdpMarketSink, KafkaMarketSink,
/// MultiplexMarketSink.
class IMarketSink {
public:
    virtual ~IMarketSink() = default;
    virtual void publish(const MarketUpdate&) = 0;
    virtual void flush() {}
    virtual void close() {}
};

}  // namespace matchbook
