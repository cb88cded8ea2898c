#include "feed/udp_sender.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace matchbook {

struct UdpSender::SockAddr {
    struct sockaddr_in addr;
};

UdpSender::UdpSender(const std::string& host, uint16_t port) : host_(host), port_(port) {
    sock_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0)
        throw std::runtime_error("UdpSender: socket() failed: " + std::string(std::strerror(errno)));

    dest_ = new SockAddr{};
    std::memset(&dest_->addr, 0, sizeof(dest_->addr));
    dest_->addr.sin_family = AF_INET;
    dest_->addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &dest_->addr.sin_addr) != 1) {
        struct addrinfo hints{}, *result = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
            ::close(sock_);
            delete dest_;
            throw std::runtime_error("UdpSender: cannot resolve " + host);
        }
        dest_->addr.sin_addr =
            reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
        freeaddrinfo(result);
    }
}

UdpSender::~UdpSender() {
    if (sock_ >= 0)
        ::close(sock_);
    delete dest_;
}

bool UdpSender::send(const uint8_t* data, size_t len) {
    const auto sent = ::sendto(
        sock_,
        data,
        len,
        0,
        reinterpret_cast<const struct sockaddr*>(&dest_->addr),
        sizeof(dest_->addr));

    if (sent < 0) {
        std::fprintf(stderr, "[feed] sendto %s:%u failed: %s\n",
                     host_.c_str(), static_cast<unsigned>(port_), std::strerror(errno));
        return false;
    }
    return true;
}

}  // namespace matchbook
