#include "feed/udp_market_sink.h"
#include "feed/market_update_json.h"

#include <cstdlib>
#include <stdexcept>

namespace matchbook {

UdpMarketSink::UdpMarketSink(const std::string& host, uint16_t port)
    : sender_(host, port) {}

void UdpMarketSink::publish(const MarketUpdate& update) {
    const std::string json = encodeMarketUpdateJson(update);
    if (json.size() > kMaxDatagramBytes)
        throw std::runtime_error("UdpMarketSink: update of " + std::to_string(json.size()) +
                                 " bytes does not fit in a datagram");

    if (sender_.send(reinterpret_cast<const uint8_t*>(json.data()), json.size()))
        ++datagrams_sent_;
    else
        ++send_failures_;
}

void parseHostPort(const std::string& spec, std::string& host, uint16_t& port) {
    const auto colon = spec.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == spec.size())
        throw std::invalid_argument("expected host:port, got '" + spec + "'");

    const std::string port_text = spec.substr(colon + 1);
    char* end = nullptr;
    const unsigned long value = std::strtoul(port_text.c_str(), &end, 10);
    if (*end != '\0' || value == 0 || value > 65535)
        throw std::invalid_argument("invalid port in '" + spec + "'");

    host = spec.substr(0, colon);
    port = static_cast<uint16_t>(value);
}

}  // namespace matchbook
