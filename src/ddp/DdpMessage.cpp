#include "ddplink/ddp/DdpMessage.hpp"

#include "ddplink/core/Error.hpp"

#include <algorithm>
#include <initializer_list>
#include <memory>

namespace ddplink::ddp {
namespace {

constexpr const char* STATUS_KEY = "status";
constexpr const char* CONFIG_KEY = "config";
constexpr const char* CONTROL_KEY = "control";

// A recognised key with the wrong JSON type is treated as absent.
void readString(const Json::Value& object, const char* key, std::optional<std::string>& out) {
    const Json::Value& value = object[key];
    if (value.isString()) {
        out = value.asString();
    }
}

void readBool(const Json::Value& object, const char* key, std::optional<bool>& out) {
    const Json::Value& value = object[key];
    if (value.isBool()) {
        out = value.asBool();
    }
}

void readUInt(const Json::Value& object, const char* key, std::optional<std::uint32_t>& out) {
    const Json::Value& value = object[key];
    if (value.isUInt()) {
        out = value.asUInt();
    }
}

std::uint32_t uintOr(const Json::Value& object, const char* key, std::uint32_t fallback) {
    const Json::Value& value = object[key];
    return value.isUInt() ? value.asUInt() : fallback;
}

Json::Value collectExtra(const Json::Value& object, std::initializer_list<const char*> known) {
    Json::Value extra(Json::objectValue);
    for (const auto& name : object.getMemberNames()) {
        const bool recognised = std::any_of(known.begin(), known.end(),
            [&name](const char* key) { return name == key; });
        if (!recognised) {
            extra[name] = object[name];
        }
    }
    return extra;
}

void mergeExtra(Json::Value& body, const Json::Value& extra) {
    if (!extra.isObject()) {
        return;
    }
    for (const auto& name : extra.getMemberNames()) {
        if (!body.isMember(name)) {
            body[name] = extra[name];
        }
    }
}

const Json::Value* channelBody(const Json::Value& document, const char* key) {
    if (!document.isObject()) {
        return nullptr;
    }
    if (!document.isMember(key)) {
        return nullptr;
    }
    const Json::Value& body = document[key];
    return body.isObject() ? &body : nullptr;
}

} // namespace

expected<DdpPacket> parsePacket(const std::uint8_t* data, std::size_t size) {
    auto header = Header::decode(data, size);
    if (!header) {
        return unexpected(header.error());
    }

    const std::size_t headerSize = header->size();
    DdpPacket packet;
    packet.header = *header;
    packet.payload.assign(data + headerSize, data + size);
    return packet;
}

expected<Json::Value> parseDocument(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return unexpected(make_error_code(core::DdpError::PayloadDecodeError));
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    const char* begin = reinterpret_cast<const char*>(data);
    if (!reader->parse(begin, begin + size, &root, &errors) || !root.isObject()) {
        return unexpected(make_error_code(core::DdpError::PayloadDecodeError));
    }
    return root;
}

DecodedReply decodeReply(Header header, std::vector<std::uint8_t> payload) {
    DecodedReply reply;
    reply.header = header;
    reply.payload = std::move(payload);

    if (!reply.header.flags.reply() || !isStructuredId(reply.header.id)) {
        return reply;
    }
    // Zero-length reply: the device has nothing for this ID.
    if (reply.payload.empty()) {
        return reply;
    }

    auto document = parseDocument(reply.payload.data(), reply.payload.size());
    if (!document) {
        reply.documentError = document.error();
        return reply;
    }

    switch (reply.header.id) {
        case id::Status:  reply.status = projectStatus(*document); break;
        case id::Config:  reply.config = projectConfig(*document); break;
        case id::Control: reply.control = projectControl(*document); break;
        default: break;
    }
    reply.document = std::move(*document);
    return reply;
}

expected<DecodedReply> decodeDatagram(const std::uint8_t* data, std::size_t size) {
    auto packet = parsePacket(data, size);
    if (!packet) {
        return unexpected(packet.error());
    }
    return decodeReply(packet->header, std::move(packet->payload));
}

std::optional<StatusInfo> projectStatus(const Json::Value& document) {
    const Json::Value* body = channelBody(document, STATUS_KEY);
    if (body == nullptr) {
        return std::nullopt;
    }

    StatusInfo status;
    readString(*body, "update", status.update);
    readString(*body, "state", status.state);
    readString(*body, "man", status.manufacturer);
    readString(*body, "mod", status.model);
    readString(*body, "ver", status.version);
    readString(*body, "mac", status.hardwareId);
    readBool(*body, "push", status.pushCapable);
    readBool(*body, "ntp", status.timeSyncCapable);
    status.extra = collectExtra(*body, {"update", "state", "man", "mod", "ver", "mac", "push", "ntp"});
    return status;
}

std::optional<ConfigInfo> projectConfig(const Json::Value& document) {
    const Json::Value* body = channelBody(document, CONFIG_KEY);
    if (body == nullptr) {
        return std::nullopt;
    }

    ConfigInfo config;
    readString(*body, "ip", config.address);
    readString(*body, "nm", config.netmask);
    readString(*body, "gw", config.gateway);

    const Json::Value& ports = (*body)["ports"];
    if (ports.isArray()) {
        for (const auto& entry : ports) {
            if (!entry.isObject()) {
                continue;
            }
            PortInfo port;
            port.port = uintOr(entry, "port", 0);
            port.ts = uintOr(entry, "ts", 0);
            port.l = uintOr(entry, "l", 0);
            port.ss = uintOr(entry, "ss", 0);
            config.ports.push_back(port);
        }
    }
    config.extra = collectExtra(*body, {"ip", "nm", "gw", "ports"});
    return config;
}

std::optional<ControlInfo> projectControl(const Json::Value& document) {
    const Json::Value* body = channelBody(document, CONTROL_KEY);
    if (body == nullptr) {
        return std::nullopt;
    }

    ControlInfo control;
    readString(*body, "fx", control.effect);
    readUInt(*body, "int", control.intensity);
    readUInt(*body, "spd", control.speed);
    readUInt(*body, "dir", control.direction);
    readUInt(*body, "save", control.save);
    readUInt(*body, "power", control.power);

    const Json::Value& colors = (*body)["colors"];
    if (colors.isArray()) {
        std::vector<ControlColor> parsed;
        for (const auto& entry : colors) {
            if (!entry.isObject()) {
                continue;
            }
            parsed.push_back(ControlColor{
                uintOr(entry, "r", 0), uintOr(entry, "g", 0), uintOr(entry, "b", 0)});
        }
        control.colors = std::move(parsed);
    }
    control.extra = collectExtra(*body,
        {"fx", "int", "spd", "dir", "colors", "save", "power"});
    return control;
}

Json::Value toDocument(const StatusInfo& status) {
    Json::Value body(Json::objectValue);
    if (status.update) body["update"] = *status.update;
    if (status.state) body["state"] = *status.state;
    if (status.manufacturer) body["man"] = *status.manufacturer;
    if (status.model) body["mod"] = *status.model;
    if (status.version) body["ver"] = *status.version;
    if (status.hardwareId) body["mac"] = *status.hardwareId;
    if (status.pushCapable) body["push"] = *status.pushCapable;
    if (status.timeSyncCapable) body["ntp"] = *status.timeSyncCapable;
    mergeExtra(body, status.extra);

    Json::Value root(Json::objectValue);
    root[STATUS_KEY] = body;
    return root;
}

Json::Value toDocument(const ConfigInfo& config) {
    Json::Value body(Json::objectValue);
    if (config.address) body["ip"] = *config.address;
    if (config.netmask) body["nm"] = *config.netmask;
    if (config.gateway) body["gw"] = *config.gateway;

    Json::Value ports(Json::arrayValue);
    for (const auto& port : config.ports) {
        Json::Value entry(Json::objectValue);
        entry["port"] = port.port;
        entry["ts"] = port.ts;
        entry["l"] = port.l;
        entry["ss"] = port.ss;
        ports.append(entry);
    }
    body["ports"] = ports;
    mergeExtra(body, config.extra);

    Json::Value root(Json::objectValue);
    root[CONFIG_KEY] = body;
    return root;
}

Json::Value toDocument(const ControlInfo& control) {
    Json::Value body(Json::objectValue);
    if (control.effect) body["fx"] = *control.effect;
    if (control.intensity) body["int"] = *control.intensity;
    if (control.speed) body["spd"] = *control.speed;
    if (control.direction) body["dir"] = *control.direction;
    if (control.colors) {
        Json::Value colors(Json::arrayValue);
        for (const auto& color : *control.colors) {
            Json::Value entry(Json::objectValue);
            entry["r"] = color.r;
            entry["g"] = color.g;
            entry["b"] = color.b;
            colors.append(entry);
        }
        body["colors"] = colors;
    }
    if (control.save) body["save"] = *control.save;
    if (control.power) body["power"] = *control.power;
    mergeExtra(body, control.extra);

    Json::Value root(Json::objectValue);
    root[CONTROL_KEY] = body;
    return root;
}

std::string serializeDocument(const Json::Value& document) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, document);
}

} // namespace ddplink::ddp
