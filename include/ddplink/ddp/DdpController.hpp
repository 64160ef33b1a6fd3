#pragma once
#include "ddplink/core/ByteBuffer.hpp"
#include "ddplink/core/Expected.hpp"
#include "ddplink/ddp/DdpConfig.hpp"
#include "ddplink/ddp/DdpConnection.hpp"
#include "ddplink/ddp/DdpMessage.hpp"
#include "ddplink/net/NetConfig.hpp"
#include "ddplink/net/TimeoutConfig.hpp"
#include "ddplink/net/UdpSocket.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ddplink::ddp {

using ddplink::expected;

struct ControllerOptions {
    /// Local port of the shared broadcast/discovery socket (0 = ephemeral).
    std::uint16_t localPort = 0;
    /// Options handed to every connection the controller creates.
    ConnectionOptions connectionDefaults{};
    /// Captured from net::TimeoutConfig::discoveryWindow() when the options are built.
    std::chrono::milliseconds discoveryWindow = net::TimeoutConfig::discoveryWindow();
    std::uint16_t statusQueryLength = config::DDP_STATUS_QUERY_LENGTH;
};

/// One answer to a discovery query.
struct DiscoveredDevice {
    net::udp::endpoint endpoint;
    DecodedReply reply;
};

/**
 * @brief Registry of connections keyed by display endpoint, plus the shared
 * socket used for synchronised Push and discovery.
 *
 * Multi-display frames:
 * 1. Create each connection with PushMode::Deferred.
 * 2. write() the frame buffer to every connection.
 * 3. broadcastPush() once so all displays flip together.
 *
 * The registry is guarded by a mutex so lookup-or-create is safe from several
 * threads. Individual connections are not; give each one a single writer.
 * The registry lock is never held while logging, so a log handler may call
 * find(), size() or localEndpoint(). It must not call broadcastPush() or
 * discover(), which log while they own the shared socket.
 */
class DdpController {
public:
    explicit DdpController(ControllerOptions options = {});
    ~DdpController();

    DdpController(const DdpController&) = delete;
    DdpController& operator=(const DdpController&) = delete;

    /// Existing connection for `remote`, or a new bound one. First creation wins.
    expected<std::shared_ptr<DdpConnection>>
    connectionFor(const net::udp::endpoint& remote,
                  PixelFormat pixelFormat = {},
                  DeviceId defaultId = id::Default);

    expected<std::shared_ptr<DdpConnection>>
    connectionFor(const std::string& target,
                  PixelFormat pixelFormat = {},
                  DeviceId defaultId = id::Default);

    std::shared_ptr<DdpConnection> find(const net::udp::endpoint& remote) const;
    bool remove(const net::udp::endpoint& remote);
    std::size_t size() const;

    /// Header-only Push frame (offset 0, length 0) to a broadcast, multicast or unicast address.
    expected<void> broadcastPush(const net::udp::endpoint& target, DeviceId targetId = id::Default);

    /**
     * @brief Send one status Query and collect replies until the window closes.
     *
     * Devices may stagger their answers; anything arriving after the window is
     * left for the next call to discard. One entry is kept per responder.
     */
    expected<std::vector<DiscoveredDevice>> discover(const net::udp::endpoint& broadcastTarget);
    expected<std::vector<DiscoveredDevice>> discover(const net::udp::endpoint& broadcastTarget,
                                                     std::chrono::milliseconds window);

    /// Local endpoint of the shared socket (unspecified until first use).
    net::udp::endpoint localEndpoint() const;

    /// Close the shared socket and drop every registered connection.
    void close();

private:
    expected<void> ensureSharedSocket();
    void discardPending();

    ControllerOptions options;

    mutable std::mutex registryMutex;
    std::map<net::udp::endpoint, std::shared_ptr<DdpConnection>> connections;

    std::mutex socketMutex;
    net::UdpSocket sharedSocket;
    mutable std::mutex endpointMutex;   // never held while logging
    net::udp::endpoint boundEndpoint{};
    core::ByteBuffer frame;
    std::vector<std::uint8_t> receiveBuffer;
};

} // namespace ddplink::ddp
