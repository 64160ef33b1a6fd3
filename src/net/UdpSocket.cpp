#include "ddplink/net/UdpSocket.hpp"
#include "ddplink/net/Deadline.hpp"

namespace ddplink::net {

error_code UdpSocket::recv_from(void* data, std::size_t max,
                                udp::endpoint& out_ep, std::size_t& out_n,
                                milliseconds timeout) {
    out_n = 0;
    if (!sock_.is_open()) {
        return asio::error::bad_descriptor;
    }
    return with_deadline(io_, timeout,
        [&](auto cb) {
            sock_.async_receive_from(asio::buffer(data, max), out_ep, 0,
                [&out_n, cb](const error_code& ec, std::size_t n) {
                    out_n = n;
                    cb(ec);
                });
        },
        [&] {
            error_code ignore;
            sock_.cancel(ignore);
        });
}

error_code UdpSocket::try_recv_from(void* data, std::size_t max,
                                    udp::endpoint& out_ep, std::size_t& out_n) {
    out_n = 0;
    error_code ec;
    sock_.non_blocking(true, ec);
    if (ec) return ec;

    out_n = sock_.receive_from(asio::buffer(data, max), out_ep, 0, ec);

    error_code restore;
    sock_.non_blocking(false, restore);
    if (ec == asio::error::try_again) {
        ec = asio::error::would_block;
    }
    return ec;
}

} // namespace ddplink::net
