#pragma once

#include <cstddef>
#include <cstdint>

namespace ddplink::ddp::config {

/**
 * @brief Constants that define DDP framing and networking behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t DDP_PORT_DEFAULT = 4048;
constexpr std::size_t DDP_MAX_DATAGRAM_SIZE = 1500;

// Framing ---------------------------------------------------------------------
constexpr std::uint8_t DDP_PROTOCOL_VERSION = 1;
constexpr std::size_t DDP_HEADER_SIZE = 10;
constexpr std::size_t DDP_HEADER_SIZE_TIMECODE = 14;
constexpr std::size_t DDP_MAX_PAYLOAD = 480 * 3;           // 480 RGB pixels per frame
constexpr std::size_t DDP_LENGTH_FIELD_MAX = 0xFFFF;
constexpr std::uint64_t DDP_OFFSET_SPACE = 0x100000000ull; // 32-bit offset field

// Sequencing ------------------------------------------------------------------
constexpr std::uint8_t DDP_SEQUENCE_UNUSED = 0;
constexpr std::uint8_t DDP_SEQUENCE_FIRST = 1;
constexpr std::uint8_t DDP_SEQUENCE_LAST = 15;

// Discovery and replies -------------------------------------------------------
constexpr std::uint16_t DDP_STATUS_QUERY_LENGTH = static_cast<std::uint16_t>(DDP_MAX_PAYLOAD);

} // namespace ddplink::ddp::config
