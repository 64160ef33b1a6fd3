// DdpMessage.hpp
// -----------------------------------------------------------------------------
// Inbound frame parsing plus the JSON documents carried on the status, config
// and control channels.
//   * parsePacket() splits a datagram into header + payload.
//   * decodeReply() parses structured replies into a Json::Value and projects
//     the recognised keys into optional-field structs.
//   * toDocument() builds outbound control/config documents for writeMessage().
// Keys this library does not know stay in the Json::Value (and in `extra`), so
// a partially understood document can be sent back without losing anything.

#pragma once

#include "ddplink/core/Expected.hpp"
#include "ddplink/ddp/DdpHeader.hpp"

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ddplink::ddp {

using ddplink::expected;

/// {"status":{...}} on ID 251.
struct StatusInfo {
    std::optional<std::string> update;
    std::optional<std::string> state;
    std::optional<std::string> manufacturer;    // "man"
    std::optional<std::string> model;           // "mod"
    std::optional<std::string> version;         // "ver"
    std::optional<std::string> hardwareId;      // "mac"
    std::optional<bool> pushCapable;            // "push"
    std::optional<bool> timeSyncCapable;        // "ntp"
    Json::Value extra{Json::objectValue};
};

/// One entry of the config "ports" array. Field meaning is device specific.
struct PortInfo {
    std::uint32_t port = 0;
    std::uint32_t ts = 0;
    std::uint32_t l = 0;
    std::uint32_t ss = 0;
};

/// {"config":{...}} on ID 250.
struct ConfigInfo {
    std::optional<std::string> address;         // "ip"
    std::optional<std::string> netmask;         // "nm"
    std::optional<std::string> gateway;         // "gw"
    std::vector<PortInfo> ports;
    Json::Value extra{Json::objectValue};
};

struct ControlColor {
    std::uint32_t r = 0;
    std::uint32_t g = 0;
    std::uint32_t b = 0;
};

/// {"control":{...}} on ID 246.
struct ControlInfo {
    std::optional<std::string> effect;          // "fx"
    std::optional<std::uint32_t> intensity;     // "int"
    std::optional<std::uint32_t> speed;         // "spd"
    std::optional<std::uint32_t> direction;     // "dir"
    std::optional<std::vector<ControlColor>> colors;
    std::optional<std::uint32_t> save;
    std::optional<std::uint32_t> power;
    Json::Value extra{Json::objectValue};
};

/// A datagram split into its header and the bytes that followed it.
struct DdpPacket {
    Header header;
    std::vector<std::uint8_t> payload;
};

struct DecodedReply {
    Header header;
    std::vector<std::uint8_t> payload;

    /// Parsed payload when the frame is a reply on a structured channel.
    std::optional<Json::Value> document;
    std::optional<StatusInfo> status;
    std::optional<ConfigInfo> config;
    std::optional<ControlInfo> control;

    /// PayloadDecodeError when a structured reply did not parse; header and
    /// payload above are still valid in that case.
    std::error_code documentError;

    bool hasDocument() const { return document.has_value(); }
};

/**
 * @brief Decode the header and keep everything after it as payload.
 *
 * The payload is returned as received, even when it is shorter or longer than
 * the header's length field; a zero-length reply means the device had nothing
 * to return for that ID.
 */
[[nodiscard]] expected<DdpPacket> parsePacket(const std::uint8_t* data, std::size_t size);

/// Parse structured replies (Reply flag + status/config/control ID); other frames pass through.
DecodedReply decodeReply(Header header, std::vector<std::uint8_t> payload);

/// parsePacket() followed by decodeReply().
[[nodiscard]] expected<DecodedReply> decodeDatagram(const std::uint8_t* data, std::size_t size);

/// Strict parse of a JSON object; PayloadDecodeError otherwise.
[[nodiscard]] expected<Json::Value> parseDocument(const std::uint8_t* data, std::size_t size);

std::optional<StatusInfo> projectStatus(const Json::Value& document);
std::optional<ConfigInfo> projectConfig(const Json::Value& document);
std::optional<ControlInfo> projectControl(const Json::Value& document);

Json::Value toDocument(const StatusInfo& status);
Json::Value toDocument(const ConfigInfo& config);
Json::Value toDocument(const ControlInfo& control);

/// Compact single-line serialisation used on the wire.
std::string serializeDocument(const Json::Value& document);

} // namespace ddplink::ddp
