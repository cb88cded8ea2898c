#ifdef MATCHBOOK_KAFKA_ENABLED

#include "feed/kafka_market_sink.h"
#include "feed/market_update_json.h"

#include <stdexcept>

namespace matchbook {

namespace {

void setOrThrow(RdKafka::Conf& conf, const std::string& key, const std::string& value) {
    std::string errstr;
    if (conf.set(key, value, errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaMarketSink: " + key + ": " + errstr);
}

}  // namespace

KafkaMarketSink::KafkaMarketSink(const std::string& brokers,
                                 const std::string& topic_name,
                                 const std::string& venue)
    : venue_(venue)
{
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
    setOrThrow(*conf, "bootstrap.servers", brokers);
    setOrThrow(*conf, "linger.ms", "5");
    // Each update carries the whole book; only the newest matters to a late reader.
    setOrThrow(*conf, "queue.buffering.max.messages", "10000");
    setOrThrow(*conf, "compression.type", "lz4");

    std::string errstr;
    if (conf->set("dr_cb", &dr_cb_, errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaMarketSink: dr_cb: " + errstr);

    producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
    if (!producer_)
        throw std::runtime_error("KafkaMarketSink: failed to create producer: " + errstr);

    std::unique_ptr<RdKafka::Conf> tconf(RdKafka::Conf::create(RdKafka::Conf::CONF_TOPIC));
    topic_.reset(RdKafka::Topic::create(producer_.get(), topic_name, tconf.get(), errstr));
    if (!topic_)
        throw std::runtime_error("KafkaMarketSink: failed to create topic " + topic_name + ": " + errstr);
}

KafkaMarketSink::~KafkaMarketSink() {
    close();
    topic_.reset();
}

void KafkaMarketSink::publish(const MarketUpdate& update) {
    const std::string json = encodeMarketUpdateJson(update);

    RdKafka::ErrorCode err = produce(json);
    if (err == RdKafka::ERR__QUEUE_FULL) {
        producer_->poll(100);
        err = produce(json);
    }

    if (err == RdKafka::ERR_NO_ERROR) {
        ++produced_;
    } else {
        ++produce_failures_;
        std::fprintf(stderr, "[feed] kafka produce failed: %s\n", RdKafka::err2str(err).c_str());
    }

    producer_->poll(0);
}

void KafkaMarketSink::flush() {
    if (producer_)
        producer_->flush(5000);
}

void KafkaMarketSink::close() {
    if (!producer_)
        return;
    if (producer_->flush(10000) != RdKafka::ERR_NO_ERROR) {
        std::fprintf(stderr, "[feed] kafka close: %d messages undelivered\n",
                     producer_->outq_len());
    }
}

// --- Private ---

RdKafka::ErrorCode KafkaMarketSink::produce(const std::string& payload) {
    return producer_->produce(
        topic_.get(),
        RdKafka::Topic::PARTITION_UA,
        RdKafka::Producer::RK_MSG_COPY,
        const_cast<char*>(payload.data()), payload.size(),
        venue_.data(), venue_.size(),
        nullptr);
}

}  // namespace matchbook

#endif  // MATCHBOOK_KAFKA_ENABLED
