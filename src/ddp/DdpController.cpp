#include "ddplink/ddp/DdpController.hpp"

#include "ddplink/ddp/DdpHeader.hpp"
#include "ddplink/log/Log.hpp"
#include "ddplink/net/Resolve.hpp"

#include <algorithm>
#include <utility>

namespace ddplink::ddp {

namespace asio = ddplink::net::asio;

namespace {
constexpr std::size_t RECEIVE_BUFFER_SIZE = 65507;
} // namespace

DdpController::DdpController(ControllerOptions opts)
: options(std::move(opts))
, receiveBuffer(RECEIVE_BUFFER_SIZE) {
}

DdpController::~DdpController() {
    close();
}

expected<std::shared_ptr<DdpConnection>>
DdpController::connectionFor(const net::udp::endpoint& remote,
                             PixelFormat pixelFormat,
                             DeviceId defaultId) {
    if (auto existing = find(remote)) {
        return existing;
    }

    // Socket setup and logging run unlocked: log handlers may call back into the registry.
    auto connection = std::make_shared<DdpConnection>(pixelFormat, defaultId,
                                                      options.connectionDefaults);
    if (auto connected = connection->connect(remote); !connected) {
        return unexpected(connected.error());
    }

    {
        std::lock_guard lock(registryMutex);
        auto [it, inserted] = connections.emplace(remote, connection);
        if (!inserted) {
            // Another caller registered this endpoint first; ours is discarded.
            return it->second;
        }
    }

    logInfo("[DdpController] registered ", remote, " (", pixelFormat.describe(),
            ", id ", describeId(defaultId), ")\n");
    return connection;
}

expected<std::shared_ptr<DdpConnection>>
DdpController::connectionFor(const std::string& target,
                             PixelFormat pixelFormat,
                             DeviceId defaultId) {
    net::udp::endpoint endpoint;
    if (auto ec = net::resolve(target, config::DDP_PORT_DEFAULT, endpoint); ec) {
        logError("[DdpController] cannot resolve '", target, "': ", ec.message(), "\n");
        return unexpected(ec);
    }
    return connectionFor(endpoint, pixelFormat, defaultId);
}

std::shared_ptr<DdpConnection> DdpController::find(const net::udp::endpoint& remote) const {
    std::lock_guard lock(registryMutex);
    auto it = connections.find(remote);
    return it == connections.end() ? nullptr : it->second;
}

bool DdpController::remove(const net::udp::endpoint& remote) {
    // Released after unlocking: the last reference closes the socket, which logs.
    std::shared_ptr<DdpConnection> removed;
    {
        std::lock_guard lock(registryMutex);
        auto it = connections.find(remote);
        if (it == connections.end()) {
            return false;
        }
        removed = std::move(it->second);
        connections.erase(it);
    }
    return true;
}

std::size_t DdpController::size() const {
    std::lock_guard lock(registryMutex);
    return connections.size();
}

expected<void> DdpController::broadcastPush(const net::udp::endpoint& target, DeviceId targetId) {
    std::lock_guard lock(socketMutex);
    if (auto ready = ensureSharedSocket(); !ready) {
        return ready;
    }

    frame.clear();
    if (auto encoded = Header::pushFrame(targetId).encodeInto(frame); !encoded) {
        return encoded;
    }

    if (auto ec = sharedSocket.send_to(frame.data(), frame.size(), target); ec) {
        logError("[DdpController] push to ", target, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    return {};
}

expected<std::vector<DiscoveredDevice>>
DdpController::discover(const net::udp::endpoint& broadcastTarget) {
    return discover(broadcastTarget, options.discoveryWindow);
}

expected<std::vector<DiscoveredDevice>>
DdpController::discover(const net::udp::endpoint& broadcastTarget,
                        std::chrono::milliseconds window) {
    std::lock_guard lock(socketMutex);
    if (auto ready = ensureSharedSocket(); !ready) {
        return unexpected(ready.error());
    }

    // Late answers to an earlier query must not count for this one.
    discardPending();

    frame.clear();
    if (auto encoded = Header::queryFrame(id::Status, 0, options.statusQueryLength).encodeInto(frame);
        !encoded) {
        return unexpected(encoded.error());
    }
    if (auto ec = sharedSocket.send_to(frame.data(), frame.size(), broadcastTarget); ec) {
        logError("[DdpController] discovery query to ", broadcastTarget,
                 " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    logInfo("[DdpController] discovery query sent to ", broadcastTarget,
            ", listening for ", window.count(), "ms\n");

    std::vector<DiscoveredDevice> devices;
    const auto deadline = std::chrono::steady_clock::now() + window;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        net::udp::endpoint sender;
        std::size_t received = 0;
        auto ec = sharedSocket.recv_from(receiveBuffer.data(), receiveBuffer.size(),
                                         sender, received, remaining);
        if (ec == asio::error::timed_out) {
            break;
        }
        if (ec) {
            logError("[DdpController] discovery receive failed: ", ec.message(), "\n");
            return unexpected(ec);
        }

        auto reply = decodeDatagram(receiveBuffer.data(), received);
        if (!reply) {
            logWarning("[DdpController] ignoring malformed frame from ", sender,
                       ": ", reply.error().message(), "\n");
            continue;
        }
        if (!reply->header.flags.reply()) {
            continue;
        }

        const bool seen = std::any_of(devices.begin(), devices.end(),
            [&sender](const DiscoveredDevice& device) { return device.endpoint == sender; });
        if (seen) {
            continue;
        }

        logInfo("[DdpController] discovered ", sender,
                reply->status && reply->status->manufacturer
                    ? " (" + *reply->status->manufacturer + ")" : std::string(),
                "\n");
        devices.push_back(DiscoveredDevice{sender, std::move(*reply)});
    }

    return devices;
}

net::udp::endpoint DdpController::localEndpoint() const {
    std::lock_guard lock(endpointMutex);
    return boundEndpoint;
}

void DdpController::close() {
    std::map<net::udp::endpoint, std::shared_ptr<DdpConnection>> released;
    {
        std::lock_guard lock(registryMutex);
        released.swap(connections);
    }
    released.clear();

    std::lock_guard lock(socketMutex);
    sharedSocket.close();
    std::lock_guard endpointLock(endpointMutex);
    boundEndpoint = net::udp::endpoint{};
}

expected<void> DdpController::ensureSharedSocket() {
    if (sharedSocket.is_open()) {
        return {};
    }

    if (auto ec = sharedSocket.open_v4(); ec) {
        logError("[DdpController] socket open failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (auto ec = sharedSocket.bind_any(options.localPort); ec) {
        logError("[DdpController] bind to local port ", options.localPort,
                 " failed: ", ec.message(), "\n");
        sharedSocket.close();
        return unexpected(ec);
    }
    if (auto ec = sharedSocket.enable_broadcast(); ec) {
        logError("[DdpController] enabling broadcast failed: ", ec.message(), "\n");
        sharedSocket.close();
        return unexpected(ec);
    }

    std::lock_guard lock(endpointMutex);
    boundEndpoint = sharedSocket.local_endpoint();
    return {};
}

void DdpController::discardPending() {
    net::udp::endpoint sender;
    std::size_t received = 0;
    while (!sharedSocket.try_recv_from(receiveBuffer.data(), receiveBuffer.size(),
                                       sender, received)) {
    }
}

} // namespace ddplink::ddp
