#include "ddplink/ddp/DdpPixelFormat.hpp"

#include "ddplink/core/Error.hpp"

namespace ddplink::ddp {
namespace {
constexpr std::uint8_t CUSTOMER_BIT = 0x80u;
constexpr std::uint8_t COLOR_SHIFT = 3;
constexpr std::uint8_t CODE_MASK = 0x07u;

constexpr std::uint8_t MAX_COLOR_CODE = static_cast<std::uint8_t>(ColorModel::Grayscale);
constexpr std::uint8_t MAX_DEPTH_CODE = static_cast<std::uint8_t>(BitDepth::Bits32);
} // namespace

std::uint8_t PixelFormat::encode() const noexcept {
    std::uint8_t byte = 0;
    if (customerDefined) {
        byte |= CUSTOMER_BIT;
    }
    byte |= static_cast<std::uint8_t>((static_cast<std::uint8_t>(colorModel) & CODE_MASK) << COLOR_SHIFT);
    byte |= static_cast<std::uint8_t>(static_cast<std::uint8_t>(bitDepth) & CODE_MASK);
    return byte;
}

expected<PixelFormat> PixelFormat::decode(std::uint8_t byte) {
    const bool customer = (byte & CUSTOMER_BIT) != 0;
    const std::uint8_t colorCode = (byte >> COLOR_SHIFT) & CODE_MASK;
    const std::uint8_t depthCode = byte & CODE_MASK;

    if (!customer) {
        if (colorCode > MAX_COLOR_CODE) {
            return unexpected(make_error_code(core::DdpError::UnknownColorModel));
        }
        if (depthCode > MAX_DEPTH_CODE) {
            return unexpected(make_error_code(core::DdpError::UnknownBitDepth));
        }
    }

    PixelFormat format;
    format.customerDefined = customer;
    format.colorModel = static_cast<ColorModel>(colorCode);
    format.bitDepth = static_cast<BitDepth>(depthCode);
    return format;
}

std::string PixelFormat::describe() const {
    if (customerDefined) {
        return "customer(" + std::to_string(static_cast<unsigned>(colorModel)) + "/" +
               std::to_string(static_cast<unsigned>(bitDepth)) + ")";
    }
    return std::string(toString(colorModel)) + "/" + toString(bitDepth);
}

const char* toString(ColorModel model) {
    switch (model) {
        case ColorModel::Undefined: return "undefined";
        case ColorModel::RGB:       return "rgb";
        case ColorModel::HSL:       return "hsl";
        case ColorModel::RGBW:      return "rgbw";
        case ColorModel::Grayscale: return "grayscale";
    }
    return "unknown";
}

const char* toString(BitDepth depth) {
    switch (depth) {
        case BitDepth::Undefined: return "undefined";
        case BitDepth::Bits1:     return "1bit";
        case BitDepth::Bits4:     return "4bit";
        case BitDepth::Bits8:     return "8bit";
        case BitDepth::Bits16:    return "16bit";
        case BitDepth::Bits24:    return "24bit";
        case BitDepth::Bits32:    return "32bit";
    }
    return "unknown";
}

unsigned bitsPerChannel(BitDepth depth) noexcept {
    switch (depth) {
        case BitDepth::Undefined: return 0;
        case BitDepth::Bits1:     return 1;
        case BitDepth::Bits4:     return 4;
        case BitDepth::Bits8:     return 8;
        case BitDepth::Bits16:    return 16;
        case BitDepth::Bits24:    return 24;
        case BitDepth::Bits32:    return 32;
    }
    return 0;
}

} // namespace ddplink::ddp
