#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>   // std::error_code

namespace ddplink::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `ddplink::net::asio` as the standalone Asio namespace.
 * - `ddplink::net::udp` as the only transport DDP needs.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace ddplink::net
