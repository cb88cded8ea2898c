#pragma once

#include "feed/i_market_sink.h"

#include <cstdio>
#include <exception>
#include <vector>

namespace matchbook {

/// Fan-out sink: forwards every update to multiple downstream sinks.
/// Best-effort: if one sink throws, the error is logged and remaining
/// sinks still receive the update. Non-owning pointers; the caller manages
/// the lifetime of downstream sinks.
class MultiplexMarketSink : public IMarketSink {
public:
    void addSink(IMarketSink* sink) { sinks_.push_back(sink); }

    void publish(const MarketUpdate& update) override {
        for (auto* s : sinks_) {
            try {
                s->publish(update);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[feed] sink error: %s\n", e.what());
            }
        }
    }

    void flush() override {
        for (auto* s : sinks_) {
            try {
                s->flush();
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[feed] flush error: %s\n", e.what());
            }
        }
    }

    void close() override {
        for (auto* s : sinks_) {
            try {
                s->close();
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[feed] close error: %s\n", e.what());
            }
        }
    }

    size_t sinkCount() const { return sinks_.size(); }

private:
    std::vector<IMarketSink*> sinks_;
};

}  // namespace matchbook
