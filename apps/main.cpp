#include "ddplink/ddp/DdpController.hpp"
#include "ddplink/log/Log.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace ddplink;

// Usage: ddplink_demo <host[:port]> [pixel count]
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <host[:port]> [pixels]\n";
        return 2;
    }

    const std::string target = argv[1];
    std::size_t pixelCount = 150;
    if (argc > 2) {
        const long parsed = std::strtol(argv[2], nullptr, 10);
        if (parsed <= 0) {
            std::cerr << "pixel count must be positive\n";
            return 2;
        }
        pixelCount = static_cast<std::size_t>(parsed);
    }

    ddp::DdpController controller;

    auto connection = controller.connectionFor(target);
    if (!connection) {
        const auto err = connection.error();
        std::cerr << "Connect failed: " << err.message()
                  << " (" << err.category().name() << ":" << err.value() << ")\n";
        return 1;
    }
    auto display = *connection;

    // Ask for status first; plenty of displays never answer, which is fine.
    if (auto sent = display->requestStatus(); sent) {
        if (auto packet = display->readReply(std::chrono::milliseconds(500)); packet) {
            const auto reply = ddp::decodeReply(packet->header, packet->payload);
            if (reply.status) {
                logInfo("[demo] display reports ",
                        reply.status->manufacturer.value_or("?"), " ",
                        reply.status->model.value_or("?"), " ",
                        reply.status->version.value_or(""), "\n");
            } else if (reply.documentError) {
                logWarning("[demo] unreadable status reply: ", reply.documentError.message(), "\n");
            }
        } else {
            logInfo("[demo] no status reply (", packet.error().message(), ")\n");
        }
    }

    // Scrolling hue gradient, ~40 fps for 30 seconds.
    std::vector<std::uint8_t> pixels(pixelCount * 3);
    const float tau = 2.0f * static_cast<float>(std::acos(-1.0));
    constexpr float brightness = 0.2f;
    const auto frameInterval = std::chrono::milliseconds(25);
    const auto started = std::chrono::steady_clock::now();

    std::cout << "Streaming " << pixelCount << " pixels to " << *display->remote() << std::endl;
    std::size_t frames = 0;
    while (std::chrono::steady_clock::now() - started < std::chrono::seconds(30)) {
        const float phase = static_cast<float>(frames % 240) / 240.0f;
        for (std::size_t i = 0; i < pixelCount; ++i) {
            const float t = static_cast<float>(i) / static_cast<float>(pixelCount) + phase;
            const float angle = t * tau;
            pixels[i * 3 + 0] = static_cast<std::uint8_t>(255.0f * brightness * (0.5f + 0.5f * std::sin(angle)));
            pixels[i * 3 + 1] = static_cast<std::uint8_t>(255.0f * brightness * (0.5f + 0.5f * std::sin(angle + tau / 3.0f)));
            pixels[i * 3 + 2] = static_cast<std::uint8_t>(255.0f * brightness * (0.5f + 0.5f * std::sin(angle + 2.0f * tau / 3.0f)));
        }

        if (auto written = display->write(pixels); !written) {
            std::cerr << "Write failed after " << written.error().fragmentsSent
                      << " fragments: " << written.error().code.message() << "\n";
            break;
        }
        ++frames;
        std::this_thread::sleep_for(frameInterval);
    }

    controller.close();
    std::cout << "Done, " << frames << " frames sent." << std::endl;
    return 0;
}
