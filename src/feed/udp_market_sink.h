#pragma once

#include "feed/i_market_sink.h"
#include "feed/udp_sender.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace matchbook {

/// Largest UDP payload over IPv4.
constexpr size_t kMaxDatagramBytes = 65507;

/// Sends each update as one JSON datagram to a fixed host:port.
/// An update whose encoding exceeds kMaxDatagramBytes is rejected with
/// std::runtime_error rather than fragmented.
class UdpMarketSink : public IMarketSink {
public:
    UdpMarketSink(const std::string& host, uint16_t port);

    void publish(const MarketUpdate& update) override;

    uint64_t datagramsSent() const { return datagrams_sent_; }
    uint64_t sendFailures() const { return send_failures_; }

private:
    UdpSender sender_;
    uint64_t datagrams_sent_ = 0;
    uint64_t send_failures_ = 0;
};

/// Split "host:port". Throws std::invalid_argument on malformed input.
void parseHostPort(const std::string& spec, std::string& host, uint16_t& port);

}  // namespace matchbook
