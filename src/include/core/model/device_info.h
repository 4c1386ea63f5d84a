#pragma once

#include "core/constant/protocol.h"
#include "device_type.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace lanbeam::core {

// Identity and transfer endpoint of one device, as advertised on the wire.
// `ip` never travels in the payload; it is filled from the packet or
// connection source address.
struct DeviceInfo {
    std::string alias;
    std::string fingerprint;
    std::string device_model;
    DeviceType device_type{DeviceType::kDesktop};
    std::string version{protocol::kVersion};
    uint16_t port{0};
    bool https{false};
    bool download{false};
    std::string ip;

    bool operator==(const DeviceInfo&) const = default;
};

// Values assumed for optional fields a peer leaves out: the receiver's own
// port and scheme.
struct DeviceInfoDefaults {
    uint16_t port{protocol::kDefaultHttpPort};
    bool https{false};
};

inline void to_json(nlohmann::json& j, const DeviceInfo& device) {
    j = nlohmann::json{
        {"alias", device.alias},
        {"version", device.version},
        {"deviceModel", device.device_model},
        {"deviceType", device.device_type},
        {"fingerprint", device.fingerprint},
        {"port", device.port},
        {"protocol", device.https ? "https" : "http"},
        {"download", device.download},
    };
}

// Throws when `alias` or `fingerprint` is missing or when a present field has
// the wrong type.
inline DeviceInfo ParseDeviceInfo(const nlohmann::json& j, const DeviceInfoDefaults& defaults) {
    DeviceInfo device;
    device.alias = j.at("alias").get<std::string>();
    device.fingerprint = j.at("fingerprint").get<std::string>();
    if (device.fingerprint.empty()) {
        throw std::invalid_argument("empty fingerprint");
    }

    auto optional = [&j](const char* key) -> const nlohmann::json* {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return nullptr;
        }
        return &*it;
    };

    if (auto* v = optional("version")) {
        device.version = v->get<std::string>();
    } else {
        device.version = protocol::kFallbackVersion;
    }
    if (auto* v = optional("deviceModel")) {
        device.device_model = v->get<std::string>();
    }
    if (auto* v = optional("deviceType")) {
        device.device_type = v->get<DeviceType>();
    }
    if (auto* v = optional("port")) {
        device.port = v->get<uint16_t>();
    } else {
        device.port = defaults.port;
    }
    if (auto* v = optional("protocol")) {
        auto scheme = v->get<std::string>();
        if (scheme != "http" && scheme != "https") {
            throw std::invalid_argument("unknown protocol " + scheme);
        }
        device.https = scheme == "https";
    } else {
        device.https = defaults.https;
    }
    if (auto* v = optional("download")) {
        device.download = v->get<bool>();
    }
    return device;
}

inline void from_json(const nlohmann::json& j, DeviceInfo& device) {
    device = ParseDeviceInfo(j, DeviceInfoDefaults{});
}

} // namespace lanbeam::core
