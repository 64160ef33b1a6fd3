#include "ddplink/ddp/DdpConnection.hpp"
#include "ddplink/core/Error.hpp"
#include "ddplink/log/Log.hpp"
#include "ddplink/net/TimeoutConfig.hpp"

#include "FakeDisplay.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace ddplink::ddp;
using ddplink::DdpError;
using namespace std::chrono_literals;

namespace asio = ddplink::net::asio;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ddplink::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ddplink::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

ddplink::net::udp::endpoint loopback(unsigned short port) {
    return ddplink::net::udp::endpoint(asio::ip::make_address_v4("127.0.0.1"), port);
}

std::vector<std::uint8_t> ramp(std::size_t size) {
    std::vector<std::uint8_t> pixels(size);
    for (std::size_t i = 0; i < size; ++i) {
        pixels[i] = static_cast<std::uint8_t>(i & 0xFFu);
    }
    return pixels;
}

bool pushSet(const std::vector<std::uint8_t>& frame) { return (frame[0] & 0x01u) != 0; }
std::uint8_t sequenceOf(const std::vector<std::uint8_t>& frame) { return frame[1] & 0x0Fu; }

} // namespace

static void testTwoFragmentWrite() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const auto pixels = ramp(1500);
    auto sent = connection.write(pixels);
    ASSERT_TRUE(sent && *sent == 2, "1500 bytes take two frames");

    auto first = display.receive();
    auto second = display.receive();
    ASSERT_TRUE(first && second, "both frames received");
    if (!first || !second) return;

    ASSERT_EQ(first->bytes.size(), std::size_t{10 + 1440}, "first frame size");
    ASSERT_EQ(ddptest::readOffset(first->bytes), 0u, "first offset");
    ASSERT_EQ(ddptest::readLength(first->bytes), std::uint16_t{1440}, "first length");
    ASSERT_TRUE(!pushSet(first->bytes), "no push on the first fragment");

    ASSERT_EQ(ddptest::readOffset(second->bytes), 1440u, "second offset");
    ASSERT_EQ(ddptest::readLength(second->bytes), std::uint16_t{60}, "second length");
    ASSERT_TRUE(pushSet(second->bytes), "push on the last fragment");

    ASSERT_EQ(sequenceOf(first->bytes), sequenceOf(second->bytes), "one sequence per write");
    ASSERT_EQ(first->bytes[2], std::uint8_t{0x0D}, "default type byte");
    ASSERT_EQ(first->bytes[3], id::Default, "default id");
    ASSERT_EQ(second->bytes[10], pixels[1440], "payload follows the header");
    ASSERT_EQ(second->bytes.back(), pixels.back(), "payload tail");
}

static void testSingleFrameAndWireBytes() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const std::vector<std::uint8_t> nine{255, 0, 0, 0, 255, 0, 0, 0, 255};
    auto sent = connection.write(nine);
    ASSERT_TRUE(sent && *sent == 1, "nine bytes in one frame");

    auto frame = display.receive();
    ASSERT_TRUE(frame.has_value(), "frame received");
    if (frame) {
        const std::vector<std::uint8_t> expected{
            0x41, 0x01, 0x0D, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x09,
            255, 0, 0, 0, 255, 0, 0, 0, 255};
        ASSERT_TRUE(frame->bytes == expected, "exact wire bytes");
    }

    const auto full = ramp(1440);
    auto one = connection.write(full);
    ASSERT_TRUE(one && *one == 1, "exactly one maximum-size frame");
    auto maxFrame = display.receive();
    ASSERT_TRUE(maxFrame && pushSet(maxFrame->bytes), "single frame carries push");
    ASSERT_TRUE(!display.receive(100ms), "no trailing empty frame");
}

static void testSequenceCycles() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const std::vector<std::uint8_t> pixel{1, 2, 3};
    for (int i = 0; i < 32; ++i) {
        const unsigned expected = static_cast<unsigned>(i % 15) + 1;
        ASSERT_EQ(static_cast<unsigned>(connection.nextSequence()), expected, "next sequence");
        auto sent = connection.write(pixel);
        ASSERT_TRUE(sent.has_value(), "write");
        auto frame = display.receive();
        ASSERT_TRUE(frame.has_value(), "frame received");
        if (frame) {
            ASSERT_EQ(static_cast<unsigned>(sequenceOf(frame->bytes)), expected, "sequence on the wire");
        }
    }
}

static void testSequencingOffAndDeferredPush() {
    ddptest::FakeDisplay display;
    ConnectionOptions options;
    options.sequencing = false;
    options.pushMode = PushMode::Deferred;
    DdpConnection connection({}, id::Default, options);
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const auto pixels = ramp(3000);
    auto sent = connection.write(pixels);
    ASSERT_TRUE(sent && *sent == 3, "three frames");
    for (int i = 0; i < 3; ++i) {
        auto frame = display.receive();
        ASSERT_TRUE(frame.has_value(), "frame received");
        if (!frame) continue;
        ASSERT_EQ(static_cast<unsigned>(sequenceOf(frame->bytes)), 0u, "sequence unused");
        ASSERT_TRUE(!pushSet(frame->bytes), "deferred mode never pushes");
    }
    ASSERT_EQ(static_cast<unsigned>(connection.nextSequence()), 0u, "nextSequence reports 0");

    connection.setPushMode(PushMode::Immediate);
    ASSERT_TRUE(connection.write(pixels.data(), 3).has_value(), "write after switching mode");
    auto pushed = display.receive();
    ASSERT_TRUE(pushed && pushSet(pushed->bytes), "immediate mode pushes again");
}

static void testWriteAtAndFormat() {
    ddptest::FakeDisplay display;
    DdpConnection connection(PixelFormat{ColorModel::RGBW, BitDepth::Bits8, false}, 3);
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const auto pixels = ramp(8);
    ASSERT_TRUE(connection.writeAt(pixels.data(), pixels.size(), 4000).has_value(), "writeAt");
    auto frame = display.receive();
    ASSERT_TRUE(frame.has_value(), "frame received");
    if (frame) {
        ASSERT_EQ(ddptest::readOffset(frame->bytes), 4000u, "base offset applied");
        ASSERT_EQ(frame->bytes[2], std::uint8_t{0x1B}, "rgbw type byte");
        ASSERT_EQ(frame->bytes[3], std::uint8_t{3}, "custom id");
    }
}

static void testEmptyWrite() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const std::vector<std::uint8_t> none;
    auto sent = connection.write(none);
    ASSERT_TRUE(sent && *sent == 0, "empty write sends nothing");
    ASSERT_EQ(static_cast<unsigned>(connection.nextSequence()), 1u, "sequence not consumed");
    ASSERT_TRUE(!display.receive(100ms), "nothing on the wire");
}

static void testStatusQueryAndReply() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");
    ASSERT_TRUE(connection.requestStatus().has_value(), "requestStatus");

    auto query = display.receive();
    ASSERT_TRUE(query.has_value(), "query received");
    if (!query) return;
    ASSERT_EQ(query->bytes.size(), std::size_t{10}, "header-only query");
    ASSERT_EQ(query->bytes[0], std::uint8_t{0x42}, "version + query flag");
    ASSERT_EQ(query->bytes[3], id::Status, "status id");
    ASSERT_EQ(ddptest::readLength(query->bytes), std::uint16_t{1440}, "requested length");

    display.sendTo(query->from, ddptest::makeReply(id::Status, R"({"status":{"man":"Acme","push":true}})"));
    auto packet = connection.readReply(1000ms);
    ASSERT_TRUE(packet.has_value(), "reply read");
    if (!packet) return;

    const DecodedReply reply = decodeReply(packet->header, packet->payload);
    ASSERT_TRUE(reply.status && reply.status->manufacturer && *reply.status->manufacturer == "Acme",
                "status decoded");
    ASSERT_TRUE(reply.status && reply.status->pushCapable && *reply.status->pushCapable, "push capable");
}

static void testReadReplyTimeout() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    ddplink::net::TimeoutConfig::ScopedOverride shortTimeout(50ms);
    const auto start = std::chrono::steady_clock::now();
    auto packet = connection.readReply();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(!packet && packet.error() == asio::error::timed_out, "timed out");
    ASSERT_TRUE(elapsed < 2s, "returned promptly");
}

static void testPollReply() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    auto empty = connection.pollReply();
    ASSERT_TRUE(!empty && empty.error() == std::errc::operation_would_block, "nothing queued yet");

    ASSERT_TRUE(connection.query(id::Config, 0, 100).has_value(), "query");
    auto query = display.receive();
    ASSERT_TRUE(query.has_value(), "query received");
    if (!query) return;
    display.sendTo(query->from, ddptest::makeReply(id::Config, R"({"config":{"ip":"10.0.0.9"}})"));

    ddplink::expected<DdpPacket> packet = ddplink::unexpected(std::make_error_code(std::errc::operation_would_block));
    for (int attempt = 0; attempt < 100 && !packet; ++attempt) {
        packet = connection.pollReply();
        if (!packet) std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(packet && packet->header.id == id::Config, "queued reply returned");
}

static void testErrors() {
    DdpConnection idle;
    const std::vector<std::uint8_t> pixel{1, 2, 3};
    auto notConnected = idle.write(pixel);
    ASSERT_TRUE(!notConnected && notConnected.error().code == std::errc::not_connected, "not connected");
    ASSERT_TRUE(!notConnected && notConnected.error().fragmentsSent == 0, "nothing sent");
    ASSERT_TRUE(!idle.requestStatus(), "query needs a connection");

    ddptest::FakeDisplay display;
    ConnectionOptions zero;
    zero.maxPayload = 0;
    DdpConnection badSize({}, id::Default, zero);
    ASSERT_TRUE(badSize.connect(loopback(display.port())).has_value(), "connect");
    auto invalid = badSize.write(pixel);
    ASSERT_TRUE(!invalid && invalid.error().code == DdpError::InvalidFragmentSize, "invalid fragment size");

    // A reply too short to hold a header.
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");
    ASSERT_TRUE(connection.requestStatus().has_value(), "requestStatus");
    auto query = display.receive();
    ASSERT_TRUE(query.has_value(), "query received");
    if (query) {
        display.sendTo(query->from, {0x44, 0x00, 0x00});
        ddplink::log::ScopedLogCapture capture;
        auto packet = connection.readReply(1000ms);
        ASSERT_TRUE(!packet && packet.error() == DdpError::TruncatedHeader, "truncated reply");
        ASSERT_TRUE(capture.contains("[DdpConnection] dropped reply"), "drop logged");
    }
}

static void testOversizedDatagramFails() {
    ddptest::FakeDisplay display;
    ConnectionOptions wide;
    wide.maxPayload = 65535;
    DdpConnection connection({}, id::Default, wide);
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const auto pixels = ramp(70000);
    ddplink::log::ScopedLogCapture capture;
    auto sent = connection.write(pixels);
    ASSERT_TRUE(!sent, "datagram beyond the UDP limit fails");
    if (!sent) {
        ASSERT_EQ(sent.error().fragmentsSent, std::size_t{0}, "failed on the first fragment");
        ASSERT_TRUE(static_cast<bool>(sent.error().code), "socket error reported");
    }
    ASSERT_EQ(static_cast<unsigned>(connection.nextSequence()), 2u, "sequence consumed by the attempt");
}

static void testWriteMessage() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    ControlInfo control;
    control.power = 1;
    auto sent = connection.writeMessage(id::Control, toDocument(control));
    ASSERT_TRUE(sent && *sent == 1, "document sent");

    auto frame = display.receive();
    ASSERT_TRUE(frame.has_value(), "frame received");
    if (!frame) return;
    ASSERT_EQ(frame->bytes[3], std::uint8_t{246}, "control id");
    ASSERT_EQ(frame->bytes[2], std::uint8_t{0}, "type undefined for documents");
    ASSERT_TRUE(pushSet(frame->bytes), "document pushed");

    const std::string body(frame->bytes.begin() + 10, frame->bytes.end());
    ASSERT_TRUE(body == R"({"control":{"power":1}})", "compact document body");
}

static void testDocumentsPushInDeferredMode() {
    ddptest::FakeDisplay display;
    ConnectionOptions options;
    options.pushMode = PushMode::Deferred;
    DdpConnection connection({}, id::Default, options);
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const std::vector<std::uint8_t> pixel{1, 2, 3};
    ASSERT_TRUE(connection.write(pixel).has_value(), "pixel write");
    auto pixels = display.receive();
    ASSERT_TRUE(pixels && !pushSet(pixels->bytes), "pixel data waits for a broadcast push");

    ControlInfo control;
    control.power = 0;
    ASSERT_TRUE(connection.writeMessage(id::Control, toDocument(control)).has_value(), "document write");
    auto document = display.receive();
    ASSERT_TRUE(document && pushSet(document->bytes), "documents are pushed regardless of mode");
}

static void testFragmentObserver() {
    ddptest::FakeDisplay display;
    std::vector<std::uint32_t> offsets;
    bool lastPushed = false;
    ConnectionOptions options;
    options.onFragmentSent = [&](const Header& header) {
        offsets.push_back(header.offset);
        lastPushed = header.flags.push();
    };
    DdpConnection connection({}, id::Default, options);
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const auto pixels = ramp(1500);
    ASSERT_TRUE(connection.write(pixels).has_value(), "write");
    ASSERT_TRUE(offsets == std::vector<std::uint32_t>({0, 1440}), "observer sees every fragment in order");
    ASSERT_TRUE(lastPushed, "last observed fragment carries push");
}

static void testFailureMidWrite() {
    ddptest::FakeDisplay display;
    DdpConnection* self = nullptr;
    ConnectionOptions options;
    options.onFragmentSent = [&self](const Header&) {
        if (self != nullptr) {
            self->close();
        }
    };
    DdpConnection connection({}, id::Default, options);
    self = &connection;
    ASSERT_TRUE(connection.connect(loopback(display.port())).has_value(), "connect");

    const auto pixels = ramp(3000);
    auto sent = connection.write(pixels);
    ASSERT_TRUE(!sent, "write stops once the socket is gone");
    if (!sent) {
        ASSERT_EQ(sent.error().fragmentsSent, std::size_t{1}, "one fragment left before the failure");
        ASSERT_TRUE(sent.error().code == std::errc::not_connected, "closed mid-write");
    }

    auto first = display.receive();
    ASSERT_TRUE(first && ddptest::readOffset(first->bytes) == 0, "first fragment delivered");
    ASSERT_TRUE(!display.receive(100ms), "remaining fragments not sent");
}

static void testConnectByName() {
    ddptest::FakeDisplay display;
    DdpConnection connection;
    const std::string target = "127.0.0.1:" + std::to_string(display.port());
    ASSERT_TRUE(connection.connect(target).has_value(), "host:port target");
    ASSERT_TRUE(connection.remote() && connection.remote()->port() == display.port(), "port parsed");

    connection.close();
    connection.close();
    ASSERT_TRUE(!connection.isConnected(), "close is idempotent");
}

int main() {
    testTwoFragmentWrite();
    testSingleFrameAndWireBytes();
    testSequenceCycles();
    testSequencingOffAndDeferredPush();
    testWriteAtAndFormat();
    testEmptyWrite();
    testStatusQueryAndReply();
    testReadReplyTimeout();
    testPollReply();
    testErrors();
    testOversizedDatagramFails();
    testWriteMessage();
    testDocumentsPushInDeferredMode();
    testFragmentObserver();
    testFailureMidWrite();
    testConnectByName();

    if (g_failures) {
        ddplink::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    ddplink::logInfo("Connection tests passed.\n");
    return 0;
}
