#include "ddplink/core/Error.hpp"

#include <string>

namespace ddplink::core {
namespace {

class DdpCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "ddp"; }

    std::string message(int value) const override {
        switch (static_cast<DdpError>(value)) {
            case DdpError::TruncatedHeader:     return "truncated header";
            case DdpError::UnsupportedVersion:  return "unsupported protocol version";
            case DdpError::UnknownColorModel:   return "unknown color model";
            case DdpError::UnknownBitDepth:     return "unknown bit depth";
            case DdpError::PayloadDecodeError:  return "payload is not a valid document";
            case DdpError::InvalidFragmentSize: return "invalid fragment size";
            case DdpError::PayloadTooLarge:     return "payload exceeds the addressable buffer";
            case DdpError::InvalidSequence:     return "sequence number outside 0..15";
        }
        return "unknown ddp error";
    }
};

} // namespace

const std::error_category& ddpCategory() noexcept {
    static const DdpCategory category;
    return category;
}

std::error_code make_error_code(DdpError error) noexcept {
    return {static_cast<int>(error), ddpCategory()};
}

} // namespace ddplink::core
