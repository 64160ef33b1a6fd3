#include "ddplink/net/Resolve.hpp"

#include <charconv>

namespace ddplink::net {

error_code resolve(const std::string& target,
                   std::uint16_t defaultPort,
                   udp::endpoint& out) {
    std::string host = target;
    std::uint16_t port = defaultPort;

    // Only a single colon means host:port; IPv6 literals are not split.
    const auto colon = target.rfind(':');
    if (colon != std::string::npos && target.find(':') == colon) {
        host = target.substr(0, colon);
        const char* first = target.data() + colon + 1;
        const char* last = target.data() + target.size();
        unsigned value = 0;
        auto [ptr, parseError] = std::from_chars(first, last, value);
        if (parseError != std::errc{} || ptr != last || value > 0xFFFFu) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        port = static_cast<std::uint16_t>(value);
    }

    error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (!ec) {
        out = udp::endpoint(address, port);
        return {};
    }

    asio::io_context io;
    udp::resolver resolver(io);
    auto results = resolver.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec) {
        return ec;
    }
    if (results.empty()) {
        return asio::error::host_not_found;
    }
    out = results.begin()->endpoint();
    return {};
}

} // namespace ddplink::net
