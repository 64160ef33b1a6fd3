/**
 * @brief Implements DdpConnection: fragmentation, framing and reply reception.
 */
#include "ddplink/ddp/DdpConnection.hpp"

#include "ddplink/core/Error.hpp"
#include "ddplink/ddp/DdpFragmenter.hpp"
#include "ddplink/log/Log.hpp"
#include "ddplink/net/Resolve.hpp"
#include "ddplink/net/TimeoutConfig.hpp"

#include <algorithm>
#include <utility>

namespace ddplink::ddp {

namespace asio = ddplink::net::asio;

namespace {
// Largest UDP payload over IPv4.
constexpr std::size_t RECEIVE_BUFFER_SIZE = 65507;
} // namespace

DdpConnection::DdpConnection(PixelFormat pixelFormat, DeviceId defaultId, ConnectionOptions opts)
: defaultPixelFormat(pixelFormat)
, destinationId(defaultId)
, options(opts)
, receiveBuffer(RECEIVE_BUFFER_SIZE) {
}

DdpConnection::~DdpConnection() {
    close();
}

expected<void> DdpConnection::connect(const net::udp::endpoint& remote) {
    close();

    if (auto ec = socket.open_v4(); ec) {
        logError("[DdpConnection] socket open failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    if (auto ec = socket.bind_any(options.localPort); ec) {
        logError("[DdpConnection] bind to local port ", options.localPort,
                 " failed: ", ec.message(), "\n");
        socket.close();
        return unexpected(ec);
    }
    // Harmless for unicast targets and required for subnet broadcast ones.
    if (auto ec = socket.enable_broadcast(); ec) {
        logError("[DdpConnection] enabling broadcast failed: ", ec.message(), "\n");
        socket.close();
        return unexpected(ec);
    }

    remoteEndpoint = remote;
    logInfo("[DdpConnection] connected to ", remote,
            " from ", socket.local_endpoint(), "\n");
    return {};
}

expected<void> DdpConnection::connect(const std::string& target, std::uint16_t port) {
    net::udp::endpoint endpoint;
    if (auto ec = net::resolve(target, port, endpoint); ec) {
        logError("[DdpConnection] cannot resolve '", target, "': ", ec.message(), "\n");
        return unexpected(ec);
    }
    return connect(endpoint);
}

void DdpConnection::close() {
    // Keep the operation idempotent so repeated calls are harmless.
    if (!socket.is_open()) {
        remoteEndpoint.reset();
        return;
    }
    logInfo("[DdpConnection] close()\n");
    socket.close();
    remoteEndpoint.reset();
}

bool DdpConnection::isConnected() const {
    return socket.is_open() && remoteEndpoint.has_value();
}

expected<std::size_t, WriteError>
DdpConnection::write(const std::uint8_t* data, std::size_t size) {
    return writeAt(data, size, 0);
}

expected<std::size_t, WriteError>
DdpConnection::write(const std::vector<std::uint8_t>& buffer) {
    return writeAt(buffer.data(), buffer.size(), 0);
}

expected<std::size_t, WriteError>
DdpConnection::writeAt(const std::uint8_t* data, std::size_t size, std::uint32_t baseOffset) {
    return sendFragments(data, size, baseOffset, destinationId, defaultPixelFormat.encode(),
                         options.pushMode == PushMode::Immediate);
}

expected<std::size_t, WriteError>
DdpConnection::writeMessage(DeviceId target, const Json::Value& document) {
    const std::string text = serializeDocument(document);
    // Documents are not pixel data, so the type byte stays undefined.
    return sendFragments(reinterpret_cast<const std::uint8_t*>(text.data()), text.size(),
                         0, target, 0, true);
}

expected<void> DdpConnection::query(DeviceId target, std::uint32_t offset, std::uint16_t length) {
    if (!isConnected()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    const Header header = Header::queryFrame(target, offset, length);
    frame.clear();
    if (auto encoded = header.encodeInto(frame); !encoded) {
        return unexpected(encoded.error());
    }

    if (auto ec = socket.send_to(frame.data(), frame.size(), *remoteEndpoint); ec) {
        logError("[DdpConnection] query to ", *remoteEndpoint, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    return {};
}

expected<void> DdpConnection::requestStatus() {
    return query(id::Status, 0, config::DDP_STATUS_QUERY_LENGTH);
}

expected<DdpPacket> DdpConnection::readReply() {
    return readReply(net::TimeoutConfig::replyTimeout());
}

expected<DdpPacket> DdpConnection::readReply(std::chrono::milliseconds timeout) {
    if (!socket.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    net::udp::endpoint sender;
    std::size_t received = 0;
    if (auto ec = socket.recv_from(receiveBuffer.data(), receiveBuffer.size(),
                                   sender, received, timeout); ec) {
        if (ec != asio::error::timed_out) {
            logError("[DdpConnection] RX error ", ec.value(), ' ', ec.category().name(),
                     " - ", ec.message(), '\n');
        }
        return unexpected(ec);
    }
    return parseInbound(received);
}

expected<DdpPacket> DdpConnection::pollReply() {
    if (!socket.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    net::udp::endpoint sender;
    std::size_t received = 0;
    if (auto ec = socket.try_recv_from(receiveBuffer.data(), receiveBuffer.size(),
                                       sender, received); ec) {
        return unexpected(ec);
    }
    return parseInbound(received);
}

std::uint8_t DdpConnection::nextSequence() const {
    return options.sequencing ? sequence : config::DDP_SEQUENCE_UNUSED;
}

expected<std::size_t, WriteError>
DdpConnection::sendFragments(const std::uint8_t* data, std::size_t size, std::uint32_t baseOffset,
                             DeviceId target, std::uint8_t type, bool pushLast) {
    if (!isConnected()) {
        return unexpected(WriteError{std::make_error_code(std::errc::not_connected), 0});
    }

    auto plan = planFragments(size, options.maxPayload, baseOffset);
    if (!plan) {
        return unexpected(WriteError{plan.error(), 0});
    }
    if (plan->empty()) {
        return std::size_t{0};
    }

    Header header;
    header.sequence = takeSequence();
    header.type = type;
    header.id = target;

    const std::size_t lastIndex = plan->size() - 1;

    std::size_t sent = 0;
    for (std::size_t index = 0; index < plan->size(); ++index) {
        // The observer may have closed the connection between fragments.
        if (!isConnected()) {
            return unexpected(WriteError{std::make_error_code(std::errc::not_connected), sent});
        }

        const Fragment& fragment = (*plan)[index];
        header.offset = fragment.offset;
        header.length = fragment.length;
        header.flags.setPush(pushLast && index == lastIndex);

        frame.clear();
        if (auto encoded = header.encodeInto(frame); !encoded) {
            return unexpected(WriteError{encoded.error(), sent});
        }
        frame.appendBytes(data + (fragment.offset - baseOffset), fragment.length);

        if (auto ec = socket.send_to(frame.data(), frame.size(), *remoteEndpoint); ec) {
            logError("[DdpConnection] TX to ", *remoteEndpoint, " failed after ", sent,
                     " of ", plan->size(), " fragments: ", ec.message(), "\n");
            return unexpected(WriteError{ec, sent});
        }
        ++sent;
        if (options.onFragmentSent) {
            options.onFragmentSent(header);
        }
    }
    return sent;
}

std::uint8_t DdpConnection::takeSequence() {
    if (!options.sequencing) {
        return config::DDP_SEQUENCE_UNUSED;
    }
    const std::uint8_t current = sequence;
    sequence = (sequence >= config::DDP_SEQUENCE_LAST)
        ? config::DDP_SEQUENCE_FIRST
        : static_cast<std::uint8_t>(sequence + 1);
    return current;
}

expected<DdpPacket> DdpConnection::parseInbound(std::size_t size) {
    auto packet = parsePacket(receiveBuffer.data(), size);
    if (!packet) {
        logError("[DdpConnection] dropped reply (", packet.error().message(), ")\n",
                 "           hex: ", toHexLine(receiveBuffer.data(), std::min<std::size_t>(size, 16)), '\n');
    }
    return packet;
}

} // namespace ddplink::ddp
