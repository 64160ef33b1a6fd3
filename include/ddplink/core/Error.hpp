#pragma once

#include <system_error>

namespace ddplink::core {

/**
 * @brief Protocol-level failures reported by the codec, fragmenter and reply decoder.
 *
 * Socket failures are not listed here: they keep the `std::error_code` that
 * Asio produced so callers can compare against `asio::error::*` directly.
 */
enum class DdpError : int {
    TruncatedHeader = 1,     // fewer than 10 bytes, or fewer than 14 with the timecode flag
    UnsupportedVersion,      // version bits are not 1
    UnknownColorModel,       // 3-bit color code outside the enumerated set
    UnknownBitDepth,         // 3-bit depth code outside the enumerated set
    PayloadDecodeError,      // status/config/control payload is not a document
    InvalidFragmentSize,     // max payload of 0, or larger than the 16-bit length field
    PayloadTooLarge,         // offset + length does not fit the 32-bit offset field
    InvalidSequence          // sequence number does not fit the 4-bit field
};

const std::error_category& ddpCategory() noexcept;

std::error_code make_error_code(DdpError error) noexcept;

} // namespace ddplink::core

namespace std {
template <>
struct is_error_code_enum<ddplink::core::DdpError> : true_type {};
} // namespace std

namespace ddplink {
using core::DdpError;
} // namespace ddplink
