// DdpHeader.hpp
// -----------------------------------------------------------------------------
// Wire header of a DDP frame.
//   byte 0     flags: VV|R|T|S|R|Q|P (version, reserved, timecode, storage,
//              reply, query, push)
//   byte 1     low nibble = sequence number (0 = unused)
//   byte 2     data type (see PixelFormat)
//   byte 3     destination/source ID
//   bytes 4-7  offset, big-endian
//   bytes 8-9  length, big-endian (payload only, never the timecode)
//   bytes 10-13 timecode, present only when T is set

#pragma once

#include "ddplink/core/ByteBuffer.hpp"
#include "ddplink/core/Expected.hpp"
#include "ddplink/ddp/DdpConfig.hpp"
#include "ddplink/ddp/DdpId.hpp"
#include "ddplink/ddp/DdpPixelFormat.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ddplink::ddp {

/**
 * @brief Flag byte with named accessors. The reserved bit is not representable,
 * so it always encodes as zero; on decode it is ignored.
 */
class PacketFlags {
public:
    PacketFlags() = default;

    /// Split a raw flag byte. Version is kept as-is so Header::decode can reject it.
    static PacketFlags fromByte(std::uint8_t byte) noexcept;
    [[nodiscard]] std::uint8_t toByte() const noexcept;

    std::uint8_t version() const noexcept { return version_; }
    bool timecode() const noexcept { return timecode_; }
    bool storage() const noexcept { return storage_; }
    bool reply() const noexcept { return reply_; }
    bool query() const noexcept { return query_; }
    bool push() const noexcept { return push_; }

    PacketFlags& setTimecode(bool on) noexcept { timecode_ = on; return *this; }
    PacketFlags& setStorage(bool on) noexcept { storage_ = on; return *this; }
    PacketFlags& setReply(bool on) noexcept { reply_ = on; return *this; }
    PacketFlags& setQuery(bool on) noexcept { query_ = on; return *this; }
    PacketFlags& setPush(bool on) noexcept { push_ = on; return *this; }

    friend bool operator==(const PacketFlags& a, const PacketFlags& b) {
        return a.toByte() == b.toByte();
    }
    friend bool operator!=(const PacketFlags& a, const PacketFlags& b) { return !(a == b); }

private:
    std::uint8_t version_ = config::DDP_PROTOCOL_VERSION;
    bool timecode_ = false;
    bool storage_ = false;
    bool reply_ = false;
    bool query_ = false;
    bool push_ = false;
};

struct Header {
    PacketFlags flags{};
    std::uint8_t sequence = config::DDP_SEQUENCE_UNUSED; // 0..15, 0 = unused
    std::uint8_t type = PixelFormat{}.encode();
    DeviceId id = id::Default;
    std::uint32_t offset = 0;
    std::uint16_t length = 0;
    std::uint32_t timecode = 0; // meaningful only when flags.timecode()

    /// 10, or 14 when the timecode flag is set.
    std::size_t size() const noexcept;

    /// Fails with InvalidSequence when `sequence` is above 15; nothing is appended then.
    [[nodiscard]] expected<void> encodeInto(core::ByteBuffer& out) const;
    [[nodiscard]] expected<std::vector<std::uint8_t>> encode() const;

    /// Fails with TruncatedHeader or UnsupportedVersion; never on reserved bits.
    static expected<Header> decode(const std::uint8_t* data, std::size_t size);

    expected<PixelFormat> pixelFormat() const { return PixelFormat::decode(type); }
    void setPixelFormat(const PixelFormat& format) { type = format.encode(); }

    /// Header-only frame that flips every display receiving it.
    static Header pushFrame(DeviceId target = id::Default);

    /// Read request for `length` bytes of `target` starting at `offset`.
    static Header queryFrame(DeviceId target, std::uint32_t offset, std::uint16_t length);

    std::string describe() const;

    friend bool operator==(const Header& a, const Header& b);
    friend bool operator!=(const Header& a, const Header& b) { return !(a == b); }
};

namespace timecode {

/// 16.16 fixed point: whole seconds in the high half, 1/65536 s in the low half.
std::uint32_t fromDuration(std::chrono::nanoseconds value) noexcept;
std::chrono::nanoseconds toDuration(std::uint32_t value) noexcept;

} // namespace timecode

std::string toHexLine(const std::uint8_t* data, std::size_t size);

} // namespace ddplink::ddp
