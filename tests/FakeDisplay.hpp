#pragma once

// Loopback stand-in for a DDP display, built on raw POSIX sockets so the
// library under test is not used to check itself.

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ddptest {

struct Datagram {
    std::vector<std::uint8_t> bytes;
    sockaddr_in from{};
};

class FakeDisplay {
public:
    FakeDisplay() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (fd_ < 0) {
            std::perror("socket");
            std::exit(1);
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0; // let the OS choose

        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            std::perror("bind");
            std::exit(1);
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~FakeDisplay() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FakeDisplay(const FakeDisplay&) = delete;
    FakeDisplay& operator=(const FakeDisplay&) = delete;

    unsigned short port() const { return port_; }

    std::optional<Datagram> receive(std::chrono::milliseconds timeout = std::chrono::milliseconds{500}) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        Datagram datagram;
        datagram.bytes.resize(70000);
        socklen_t len = sizeof(datagram.from);
        const auto n = ::recvfrom(fd_, datagram.bytes.data(), datagram.bytes.size(), 0,
                                  reinterpret_cast<sockaddr*>(&datagram.from), &len);
        if (n < 0) {
            return std::nullopt;
        }
        datagram.bytes.resize(static_cast<std::size_t>(n));
        return datagram;
    }

    bool sendTo(const sockaddr_in& to, const std::vector<std::uint8_t>& bytes) {
        const auto n = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                                reinterpret_cast<const sockaddr*>(&to), sizeof(to));
        return n == static_cast<ssize_t>(bytes.size());
    }

private:
    int fd_ = -1;
    unsigned short port_ = 0;
};

/// Reply frame (version 1, Reply flag) carrying `body` on `id`.
inline std::vector<std::uint8_t> makeReply(std::uint8_t id, const std::string& body) {
    std::vector<std::uint8_t> frame{
        0x44, 0x00, 0x00, id,
        0x00, 0x00, 0x00, 0x00,
        static_cast<std::uint8_t>((body.size() >> 8) & 0xFFu),
        static_cast<std::uint8_t>(body.size() & 0xFFu)};
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

inline std::uint32_t readOffset(const std::vector<std::uint8_t>& frame) {
    return (static_cast<std::uint32_t>(frame[4]) << 24) | (static_cast<std::uint32_t>(frame[5]) << 16)
         | (static_cast<std::uint32_t>(frame[6]) << 8) | static_cast<std::uint32_t>(frame[7]);
}

inline std::uint16_t readLength(const std::vector<std::uint8_t>& frame) {
    return static_cast<std::uint16_t>((frame[8] << 8) | frame[9]);
}

} // namespace ddptest
