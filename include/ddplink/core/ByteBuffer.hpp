#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ddplink::core {

/**
 * @brief Growable frame assembly buffer. Multi-byte values are written big-endian
 * (network order), which is what every DDP header field uses.
 */
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendUInt16(std::uint16_t value);
    void appendUInt32(std::uint32_t value);
    void appendBytes(const std::uint8_t* bytes, std::size_t count);

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

    std::vector<std::uint8_t> toVector() const { return buffer; }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace ddplink::core
