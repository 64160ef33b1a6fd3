#pragma once

#include "ddplink/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ddplink::ddp {

using ddplink::expected;

struct Fragment {
    std::uint32_t offset = 0;
    std::uint16_t length = 0;

    friend bool operator==(const Fragment& a, const Fragment& b) {
        return a.offset == b.offset && a.length == b.length;
    }
    friend bool operator!=(const Fragment& a, const Fragment& b) { return !(a == b); }
};

using FragmentPlan = std::vector<Fragment>;

/**
 * @brief Slice `totalLength` bytes into frames of at most `maxPayload` bytes.
 *
 * Greedy left to right: full `maxPayload` slices, then one shorter remainder if
 * anything is left. An empty buffer gives an empty plan. Offsets start at
 * `baseOffset` so a buffer can target a region of the remote frame buffer.
 *
 * Fails with InvalidFragmentSize when `maxPayload` is 0 or does not fit the
 * 16-bit length field, and with PayloadTooLarge when the last byte would land
 * beyond the 32-bit offset space.
 */
[[nodiscard]] expected<FragmentPlan> planFragments(std::size_t totalLength,
                                                   std::size_t maxPayload,
                                                   std::uint32_t baseOffset = 0);

} // namespace ddplink::ddp
