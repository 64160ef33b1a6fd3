#pragma once

#include <cstdint>
#include <string>

namespace ddplink::ddp {

/**
 * @brief Destination/source ID byte. Carried verbatim; only the reserved
 * values below carry meaning for this library.
 */
using DeviceId = std::uint8_t;

namespace id {
constexpr DeviceId Reserved  = 0;
constexpr DeviceId Default   = 1;   // default output device
constexpr DeviceId Control   = 246; // JSON control (read/write)
constexpr DeviceId Config    = 250; // JSON config (read/write)
constexpr DeviceId Status    = 251; // JSON status (read only)
constexpr DeviceId Dmx       = 254; // DMX legacy transport
constexpr DeviceId Broadcast = 255; // all devices
} // namespace id

/// True for the channels whose replies carry a structured document.
constexpr bool isStructuredId(DeviceId value) noexcept {
    return value == id::Control || value == id::Config || value == id::Status;
}

/// Human readable label for logs, e.g. "status(251)" or "custom(7)".
std::string describeId(DeviceId value);

} // namespace ddplink::ddp
