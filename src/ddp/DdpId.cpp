#include "ddplink/ddp/DdpId.hpp"

namespace ddplink::ddp {

std::string describeId(DeviceId value) {
    const char* name = nullptr;
    switch (value) {
        case id::Reserved:  name = "reserved"; break;
        case id::Default:   name = "default"; break;
        case id::Control:   name = "control"; break;
        case id::Config:    name = "config"; break;
        case id::Status:    name = "status"; break;
        case id::Dmx:       name = "dmx"; break;
        case id::Broadcast: name = "broadcast"; break;
        default:            name = "custom"; break;
    }
    return std::string(name) + "(" + std::to_string(static_cast<unsigned>(value)) + ")";
}

} // namespace ddplink::ddp
