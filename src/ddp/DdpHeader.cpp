#include "ddplink/ddp/DdpHeader.hpp"

#include "ddplink/core/Error.hpp"

#include <iomanip>
#include <sstream>

namespace ddplink::ddp {
namespace {
constexpr std::uint8_t VERSION_SHIFT = 6;
constexpr std::uint8_t VERSION_MASK = 0xC0u;
constexpr std::uint8_t TIMECODE = 0x10u;
constexpr std::uint8_t STORAGE = 0x08u;
constexpr std::uint8_t REPLY = 0x04u;
constexpr std::uint8_t QUERY = 0x02u;
constexpr std::uint8_t PUSH = 0x01u;
constexpr std::uint8_t SEQUENCE_MASK = 0x0Fu;

std::uint16_t read_be_u16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[0]) << 8)
                                      | static_cast<std::uint16_t>(data[1]));
}

std::uint32_t read_be_u32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24)
         | (static_cast<std::uint32_t>(data[1]) << 16)
         | (static_cast<std::uint32_t>(data[2]) << 8)
         | static_cast<std::uint32_t>(data[3]);
}
} // namespace

PacketFlags PacketFlags::fromByte(std::uint8_t byte) noexcept {
    PacketFlags flags;
    flags.version_ = static_cast<std::uint8_t>((byte & VERSION_MASK) >> VERSION_SHIFT);
    flags.timecode_ = (byte & TIMECODE) != 0;
    flags.storage_ = (byte & STORAGE) != 0;
    flags.reply_ = (byte & REPLY) != 0;
    flags.query_ = (byte & QUERY) != 0;
    flags.push_ = (byte & PUSH) != 0;
    return flags;
}

std::uint8_t PacketFlags::toByte() const noexcept {
    std::uint8_t byte = static_cast<std::uint8_t>((version_ << VERSION_SHIFT) & VERSION_MASK);
    if (timecode_) byte |= TIMECODE;
    if (storage_)  byte |= STORAGE;
    if (reply_)    byte |= REPLY;
    if (query_)    byte |= QUERY;
    if (push_)     byte |= PUSH;
    return byte;
}

std::size_t Header::size() const noexcept {
    return flags.timecode() ? config::DDP_HEADER_SIZE_TIMECODE : config::DDP_HEADER_SIZE;
}

expected<void> Header::encodeInto(core::ByteBuffer& out) const {
    if (sequence > config::DDP_SEQUENCE_LAST) {
        return unexpected(make_error_code(core::DdpError::InvalidSequence));
    }
    out.appendUInt8(flags.toByte());
    out.appendUInt8(sequence);
    out.appendUInt8(type);
    out.appendUInt8(id);
    out.appendUInt32(offset);
    out.appendUInt16(length);
    if (flags.timecode()) {
        out.appendUInt32(timecode);
    }
    return {};
}

expected<std::vector<std::uint8_t>> Header::encode() const {
    core::ByteBuffer buffer;
    if (auto encoded = encodeInto(buffer); !encoded) {
        return unexpected(encoded.error());
    }
    return buffer.toVector();
}

expected<Header> Header::decode(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size < config::DDP_HEADER_SIZE) {
        return unexpected(make_error_code(core::DdpError::TruncatedHeader));
    }

    Header header;
    header.flags = PacketFlags::fromByte(data[0]);
    if (header.flags.version() != config::DDP_PROTOCOL_VERSION) {
        return unexpected(make_error_code(core::DdpError::UnsupportedVersion));
    }
    if (header.flags.timecode() && size < config::DDP_HEADER_SIZE_TIMECODE) {
        return unexpected(make_error_code(core::DdpError::TruncatedHeader));
    }

    header.sequence = static_cast<std::uint8_t>(data[1] & SEQUENCE_MASK);
    header.type = data[2];
    header.id = data[3];
    header.offset = read_be_u32(data + 4);
    header.length = read_be_u16(data + 8);
    header.timecode = header.flags.timecode() ? read_be_u32(data + 10) : 0;
    return header;
}

Header Header::pushFrame(DeviceId target) {
    Header header;
    header.flags.setPush(true);
    header.type = 0;
    header.id = target;
    return header;
}

Header Header::queryFrame(DeviceId target, std::uint32_t offset, std::uint16_t length) {
    Header header;
    header.flags.setQuery(true);
    header.type = 0;
    header.id = target;
    header.offset = offset;
    header.length = length;
    return header;
}

std::string Header::describe() const {
    std::ostringstream os;
    os << "v" << static_cast<unsigned>(flags.version())
       << (flags.timecode() ? " T" : "")
       << (flags.storage() ? " S" : "")
       << (flags.reply() ? " R" : "")
       << (flags.query() ? " Q" : "")
       << (flags.push() ? " P" : "")
       << " seq=" << static_cast<unsigned>(sequence)
       << " type=0x" << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<unsigned>(type) << std::dec
       << " id=" << describeId(id)
       << " offset=" << offset
       << " length=" << length;
    if (flags.timecode()) {
        os << " timecode=0x" << std::hex << timecode << std::dec;
    }
    return os.str();
}

bool operator==(const Header& a, const Header& b) {
    if (a.flags != b.flags || a.sequence != b.sequence || a.type != b.type ||
        a.id != b.id || a.offset != b.offset || a.length != b.length) {
        return false;
    }
    return !a.flags.timecode() || a.timecode == b.timecode;
}

namespace timecode {

std::uint32_t fromDuration(std::chrono::nanoseconds value) noexcept {
    if (value.count() <= 0) {
        return 0;
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(value);
    const auto remainder = value - seconds;
    const auto fraction = (static_cast<std::uint64_t>(remainder.count()) << 16) / 1'000'000'000ull;
    return (static_cast<std::uint32_t>(seconds.count() & 0xFFFF) << 16)
         | static_cast<std::uint32_t>(fraction & 0xFFFFu);
}

std::chrono::nanoseconds toDuration(std::uint32_t value) noexcept {
    const std::uint64_t seconds = value >> 16;
    const std::uint64_t fraction = value & 0xFFFFu;
    const std::uint64_t nanos = seconds * 1'000'000'000ull + ((fraction * 1'000'000'000ull) >> 16);
    return std::chrono::nanoseconds{static_cast<std::int64_t>(nanos)};
}

} // namespace timecode

std::string toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace ddplink::ddp
