#pragma once

#include "ddplink/core/Expected.hpp"

#include <cstdint>
#include <string>

namespace ddplink::ddp {

using ddplink::expected;

/// TTT field of the type byte.
enum class ColorModel : std::uint8_t {
    Undefined = 0,
    RGB       = 1,
    HSL       = 2,
    RGBW      = 3,
    Grayscale = 4
};

/// SSS field of the type byte: bits per channel.
enum class BitDepth : std::uint8_t {
    Undefined = 0,
    Bits1     = 1,
    Bits4     = 2,
    Bits8     = 3,
    Bits16    = 4,
    Bits24    = 5,
    Bits32    = 6
};

/**
 * @brief Data type byte: C|R|TTT|SSS.
 *
 * With `customerDefined` set the TTT and SSS codes belong to the vendor, so
 * decoding keeps them verbatim instead of validating against the enums above.
 * The reserved bit always encodes as 0.
 */
struct PixelFormat {
    ColorModel colorModel = ColorModel::RGB;
    BitDepth bitDepth = BitDepth::Bits24;
    bool customerDefined = false;

    [[nodiscard]] std::uint8_t encode() const noexcept;
    [[nodiscard]] static expected<PixelFormat> decode(std::uint8_t byte);

    std::string describe() const;

    friend bool operator==(const PixelFormat& a, const PixelFormat& b) {
        return a.colorModel == b.colorModel && a.bitDepth == b.bitDepth &&
               a.customerDefined == b.customerDefined;
    }
    friend bool operator!=(const PixelFormat& a, const PixelFormat& b) { return !(a == b); }
};

const char* toString(ColorModel model);
const char* toString(BitDepth depth);

/// Bits per channel for a depth code, 0 for Undefined.
unsigned bitsPerChannel(BitDepth depth) noexcept;

} // namespace ddplink::ddp
