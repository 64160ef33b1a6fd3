#pragma once
#include "ddplink/net/NetConfig.hpp"

#include <cstddef>
#include <cstdint>

namespace ddplink::net {

/**
 * UdpSocket
 *
 * Datagram socket with its own `asio::io_context`, driven only from the thread
 * that calls into it. Sends are plain blocking `send_to` calls (a send can only
 * stall on kernel buffer space); receives either wait with a deadline or poll.
 *
 * Closing the socket aborts a pending receive.
 */
class UdpSocket {
public:
    UdpSocket() : sock_(io_) {}

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    error_code bind_any(std::uint16_t port) {
        return bind(udp::endpoint(udp::v4(), port));
    }

    error_code bind(const udp::endpoint& ep) {
        error_code ec;
        if (!sock_.is_open()) {
            sock_.open(ep.protocol(), ec);
            if (ec) return ec;
        }
        sock_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) return ec;
        sock_.bind(ep, ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    // Send one datagram; a short send is reported as message_size.
    error_code send_to(const void* data, std::size_t n, const udp::endpoint& ep) {
        error_code ec;
        const auto sent = sock_.send_to(asio::buffer(data, n), ep, 0, ec);
        if (!ec && sent != n) {
            ec = asio::error::message_size;
        }
        return ec;
    }

    // Receive one datagram, with timeout. Fills out_ep + out_n.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout);

    // Receive one datagram if one is already queued, else would_block.
    error_code try_recv_from(void* data, std::size_t max,
                             udp::endpoint& out_ep, std::size_t& out_n);

    udp::endpoint local_endpoint() const {
        error_code ignore;
        return sock_.local_endpoint(ignore);
    }

    bool is_open() const { return sock_.is_open(); }
    udp::socket& raw() { return sock_; }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    asio::io_context io_;
    udp::socket sock_;
};

} // namespace ddplink::net
