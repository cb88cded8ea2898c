#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace matchbook {

/// Fire-and-forget unicast UDP sender (POSIX sockets).
class UdpSender {
public:
    /// Resolves `host` at construction time.
    /// Throws std::runtime_error if the socket cannot be created or the host
    /// does not resolve.
    UdpSender(const std::string& host, uint16_t port);
    ~UdpSender();

    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    /// Send a datagram. Returns true on success.
    bool send(const uint8_t* data, size_t len);

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    struct SockAddr;

    std::string host_;
    uint16_t port_;
    int sock_ = -1;
    SockAddr* dest_ = nullptr;
};

}  // namespace matchbook
