#pragma once
#include "ddplink/net/NetConfig.hpp"

#include <cstdint>
#include <string>

namespace ddplink::net {

/**
 * resolve
 *
 * Synchronous lookup of a DDP destination. `host` may be a dotted quad or a
 * name; the first IPv4 result wins. `target` may also carry an explicit port
 * ("10.0.1.184:4048"), otherwise `defaultPort` is used.
 */
error_code resolve(const std::string& target,
                   std::uint16_t defaultPort,
                   udp::endpoint& out);

} // namespace ddplink::net
