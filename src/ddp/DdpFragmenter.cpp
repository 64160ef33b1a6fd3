#include "ddplink/ddp/DdpFragmenter.hpp"

#include "ddplink/core/Error.hpp"
#include "ddplink/ddp/DdpConfig.hpp"

namespace ddplink::ddp {

expected<FragmentPlan> planFragments(std::size_t totalLength,
                                     std::size_t maxPayload,
                                     std::uint32_t baseOffset) {
    if (maxPayload == 0 || maxPayload > config::DDP_LENGTH_FIELD_MAX) {
        return unexpected(make_error_code(core::DdpError::InvalidFragmentSize));
    }
    if (static_cast<std::uint64_t>(baseOffset) + totalLength > config::DDP_OFFSET_SPACE) {
        return unexpected(make_error_code(core::DdpError::PayloadTooLarge));
    }

    FragmentPlan plan;
    plan.reserve((totalLength + maxPayload - 1) / maxPayload);

    std::size_t position = 0;
    while (position < totalLength) {
        const std::size_t remaining = totalLength - position;
        const std::size_t length = remaining < maxPayload ? remaining : maxPayload;
        plan.push_back(Fragment{
            static_cast<std::uint32_t>(baseOffset + position),
            static_cast<std::uint16_t>(length)});
        position += length;
    }
    return plan;
}

} // namespace ddplink::ddp
