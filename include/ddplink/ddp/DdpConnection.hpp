#pragma once
#include "ddplink/core/ByteBuffer.hpp"
#include "ddplink/core/Expected.hpp"
#include "ddplink/ddp/DdpConfig.hpp"
#include "ddplink/ddp/DdpHeader.hpp"
#include "ddplink/ddp/DdpId.hpp"
#include "ddplink/ddp/DdpMessage.hpp"
#include "ddplink/ddp/DdpPixelFormat.hpp"
#include "ddplink/net/NetConfig.hpp"
#include "ddplink/net/UdpSocket.hpp"

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ddplink::ddp {

using ddplink::expected;
namespace ip = ddplink::net::asio::ip;

/// Whether the last fragment of a write carries the Push flag.
enum class PushMode {
    Immediate, // this connection is the only recipient of the frame
    Deferred   // several displays are filled first, then DdpController::broadcastPush()
};

struct ConnectionOptions {
    std::size_t maxPayload = config::DDP_MAX_PAYLOAD;
    bool sequencing = true;
    PushMode pushMode = PushMode::Immediate;
    std::uint16_t localPort = 0; // 0 = ephemeral
    /// Called on the writing thread after each fragment leaves the socket.
    std::function<void(const Header& header)> onFragmentSent{};
};

/**
 * @brief Failure of a write: the socket error plus how many fragments of the
 * current write were already sent. Codec/fragmenter errors report 0.
 */
struct WriteError {
    std::error_code code;
    std::size_t fragmentsSent = 0;
};

/**
 * @brief Sender bound to one DDP display.
 *
 * Responsibilities:
 * - Own the UDP socket and the remote endpoint.
 * - Split pixel buffers into frames, stamp them with the default pixel format,
 *   ID and the rolling sequence number, and send them in offset order.
 * - Send queries and structured documents, and receive replies.
 *
 * Sends are fire-and-forget. A connection is meant to be driven by one thread
 * at a time; callers sharing it across threads must serialise access.
 */
class DdpConnection {
public:
    explicit DdpConnection(PixelFormat pixelFormat = {},
                           DeviceId defaultId = id::Default,
                           ConnectionOptions options = {});
    ~DdpConnection();

    // non-copyable / non-movable
    DdpConnection(const DdpConnection&) = delete;
    DdpConnection& operator=(const DdpConnection&) = delete;
    DdpConnection(DdpConnection&&) = delete;
    DdpConnection& operator=(DdpConnection&&) = delete;

    /**
     * @brief Bind a local socket and remember the display endpoint.
     * @param remote Display address and port.
     */
    expected<void> connect(const net::udp::endpoint& remote);

    /**
     * @brief Convenience overload for "host" or "host:port" strings.
     * @param target Display address (e.g. "192.168.1.40" or "wled.local:4048").
     * @param port Used when `target` carries no port (defaults to 4048).
     */
    expected<void> connect(const std::string& target,
                           std::uint16_t port = config::DDP_PORT_DEFAULT);

    void close();                        // idempotent
    bool isConnected() const;

    /// Send `size` bytes starting at offset 0. Returns the number of frames sent.
    expected<std::size_t, WriteError> write(const std::uint8_t* data, std::size_t size);
    expected<std::size_t, WriteError> write(const std::vector<std::uint8_t>& buffer);

    /// Like write(), but the first byte lands at `baseOffset` in the display buffer.
    expected<std::size_t, WriteError> writeAt(const std::uint8_t* data, std::size_t size,
                                              std::uint32_t baseOffset);

    /**
     * @brief Serialise `document` and send it on `target` (control or config channel).
     *
     * The last fragment always carries Push, whatever pushMode() says: a
     * document is applied by the device as soon as it is complete.
     */
    expected<std::size_t, WriteError> writeMessage(DeviceId target, const Json::Value& document);

    /// Single Query frame asking for `length` bytes of `target` from `offset`.
    expected<void> query(DeviceId target, std::uint32_t offset, std::uint16_t length);
    expected<void> requestStatus();

    /// Wait for one datagram using the process default timeout (net::TimeoutConfig).
    expected<DdpPacket> readReply();
    expected<DdpPacket> readReply(std::chrono::milliseconds timeout);

    /// Return a queued datagram, or an error equal to std::errc::operation_would_block.
    expected<DdpPacket> pollReply();

    const std::optional<net::udp::endpoint>& remote() const { return remoteEndpoint; }
    net::udp::endpoint localEndpoint() const { return socket.local_endpoint(); }

    PixelFormat pixelFormat() const { return defaultPixelFormat; }
    void setPixelFormat(const PixelFormat& format) { defaultPixelFormat = format; }

    DeviceId defaultId() const { return destinationId; }
    void setDefaultId(DeviceId value) { destinationId = value; }

    PushMode pushMode() const { return options.pushMode; }
    void setPushMode(PushMode mode) { options.pushMode = mode; }

    const ConnectionOptions& connectionOptions() const { return options; }

    /// Sequence number the next write will carry (0 when sequencing is off).
    std::uint8_t nextSequence() const;

private:
    expected<std::size_t, WriteError>
    sendFragments(const std::uint8_t* data, std::size_t size, std::uint32_t baseOffset,
                  DeviceId target, std::uint8_t type, bool pushLast);

    /// Hand out the current sequence number and advance it, 15 wraps to 1.
    std::uint8_t takeSequence();

    expected<DdpPacket> parseInbound(std::size_t size);

    PixelFormat defaultPixelFormat;
    DeviceId destinationId;
    ConnectionOptions options;

    std::uint8_t sequence = config::DDP_SEQUENCE_FIRST;
    net::UdpSocket socket;
    std::optional<net::udp::endpoint> remoteEndpoint{};
    core::ByteBuffer frame;
    std::vector<std::uint8_t> receiveBuffer;
};

} // namespace ddplink::ddp
