#pragma once

#ifdef MATCHBOOK_KAFKA_ENABLED

#include "feed/i_market_sink.h"

#include <librdkafka/rdkafkacpp.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace matchbook {

/// Kafka market sink: publishes each update as a JSON message to a topic,
/// keyed by venue name so one venue's updates stay ordered on a partition.
/// Best-effort: produce and delivery failures are logged and counted, never
/// thrown back into the exchange.
class KafkaMarketSink : public IMarketSink {
public:
    KafkaMarketSink(const std::string& brokers,
                    const std::string& topic,
                    const std::string& venue);

    ~KafkaMarketSink() override;

    KafkaMarketSink(const KafkaMarketSink&) = delete;
    KafkaMarketSink& operator=(const KafkaMarketSink&) = delete;

    void publish(const MarketUpdate& update) override;
    void flush() override;
    void close() override;

    uint64_t messagesProduced() const { return produced_; }
    uint64_t produceFailures() const { return produce_failures_; }
    uint64_t deliveryFailures() const { return dr_cb_.failures.load(); }

private:
    RdKafka::ErrorCode produce(const std::string& payload);

    std::string venue_;
    std::unique_ptr<RdKafka::Producer> producer_;
    std::unique_ptr<RdKafka::Topic> topic_;
    uint64_t produced_ = 0;
    uint64_t produce_failures_ = 0;

    class DeliveryReportCb : public RdKafka::DeliveryReportCb {
    public:
        void dr_cb(RdKafka::Message& message) override {
            if (message.err()) {
                ++failures;
                std::fprintf(stderr, "[feed] kafka delivery failed: %s\n",
                             message.errstr().c_str());
            }
        }
        std::atomic<uint64_t> failures{0};
    };

    DeliveryReportCb dr_cb_;
};

}  // namespace matchbook

#endif  // MATCHBOOK_KAFKA_ENABLED
